#include <gtest/gtest.h>
#include "projmap/parser.hpp"
#include <algorithm>

using namespace projmap;

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

const char* PYTHON_SOURCE = R"(import os
import numpy as np
from . import sibling
from ..pkg.mod import thing
from collections import OrderedDict

def helper(x: int) -> int:
    return x * 2

@decorator
def main():
    value = helper(3)
    print(value)

def lonely():
    pass

class Service:
    def __init__(self):
        self.items = []

    @staticmethod
    def build(config):
        return Service.create(config)

    def run(self):
        self.process()
)";

const char* C_SOURCE = R"(#include <stdio.h>
#include "util.h"

static int square(int x) { return x * x; }

int main(void) {
    printf("%d\n", square(4));
    return 0;
}
)";

const char* CPP_SOURCE = R"(#include <vector>
#include "widget.hpp"

namespace ui {

class Widget {
public:
    void draw();
    int size() const { return compute(); }
private:
    int compute() const;
};

void Widget::draw() {
    helper::render(this);
    auto *w = new Widget();
    w->size();
}

}

int main() {
    ui::Widget w;
    w.draw();
    return 0;
}
)";

const char* JS_SOURCE = R"(import React from 'react';
import { format } from "./format";
const path = require('path');
export * from '../shared/index';

function render(items) {
    return items.map(format);
}

export const total = (items) => sum(items);
const double = x => x * 2;

export class Cart {
    constructor(items) {
        this.items = items;
    }

    add(item) {
        this.items.push(item);
        return new Cart(this.items);
    }
}
)";

} // namespace

TEST(ParserTest, Python_FunctionsWithSignatures) {
    ExtractedFile file = extract_source(Language::Python, PYTHON_SOURCE);

    ASSERT_EQ(file.functions.count("helper"), 1u);
    EXPECT_EQ(symbol_signature(file.functions.at("helper")), "(x: int) -> int");
    ASSERT_EQ(file.functions.count("main"), 1u);
    EXPECT_EQ(symbol_signature(file.functions.at("main")), "()");
}

TEST(ParserTest, Python_CallsRecordedOnlyWhenPresent) {
    ExtractedFile file = extract_source(Language::Python, PYTHON_SOURCE);

    const auto& calls = symbol_calls(file.functions.at("main"));
    EXPECT_TRUE(contains(calls, "helper"));
    EXPECT_TRUE(contains(calls, "print"));
    EXPECT_TRUE(std::holds_alternative<std::string>(file.functions.at("lonely")));
}

TEST(ParserTest, Python_ClassMethodsIncludingDecorated) {
    ExtractedFile file = extract_source(Language::Python, PYTHON_SOURCE);

    ASSERT_EQ(file.classes.count("Service"), 1u);
    const auto& methods = file.classes.at("Service").methods;
    EXPECT_EQ(methods.size(), 3u);
    EXPECT_EQ(symbol_signature(methods.at("__init__")), "(self)");
    EXPECT_EQ(symbol_calls(methods.at("build")), std::vector<std::string>{"create"});
    EXPECT_EQ(symbol_calls(methods.at("run")), std::vector<std::string>{"process"});
    EXPECT_EQ(file.functions.count("__init__"), 0u);
}

TEST(ParserTest, Python_ImportsWithRelativeForms) {
    ExtractedFile file = extract_source(Language::Python, PYTHON_SOURCE);

    EXPECT_EQ(file.imports,
              (std::vector<std::string>{"os", "numpy", ".", "../pkg/mod", "collections"}));
}

TEST(ParserTest, PythonRelativeImport_Conversion) {
    EXPECT_EQ(python_relative_import("."), ".");
    EXPECT_EQ(python_relative_import(".utils"), "./utils");
    EXPECT_EQ(python_relative_import(".pkg.mod"), "./pkg/mod");
    EXPECT_EQ(python_relative_import(".."), "../");
    EXPECT_EQ(python_relative_import("...core"), "../../core");
    EXPECT_EQ(python_relative_import("absolute.mod"), "absolute.mod");
}

TEST(ParserTest, C_FunctionsCallsAndIncludes) {
    ExtractedFile file = extract_source(Language::C, C_SOURCE);

    ASSERT_EQ(file.functions.count("square"), 1u);
    EXPECT_EQ(symbol_signature(file.functions.at("square")), "(int x) -> int");
    ASSERT_EQ(file.functions.count("main"), 1u);
    const auto& calls = symbol_calls(file.functions.at("main"));
    EXPECT_TRUE(contains(calls, "printf"));
    EXPECT_TRUE(contains(calls, "square"));
    EXPECT_TRUE(file.classes.empty());
    EXPECT_EQ(file.imports, (std::vector<std::string>{"stdio.h", "./util.h"}));
}

TEST(ParserTest, Cpp_MethodsFromBodyAndOutOfClassDefinition) {
    ExtractedFile file = extract_source(Language::Cpp, CPP_SOURCE);

    ASSERT_EQ(file.classes.count("Widget"), 1u);
    const auto& methods = file.classes.at("Widget").methods;
    EXPECT_EQ(methods.count("draw"), 1u);
    EXPECT_EQ(methods.count("size"), 1u);
    EXPECT_EQ(methods.count("compute"), 1u);

    // The definition's calls are merged into the declared method
    const auto& draw_calls = symbol_calls(methods.at("draw"));
    EXPECT_TRUE(contains(draw_calls, "render"));
    EXPECT_TRUE(contains(draw_calls, "Widget"));
    EXPECT_TRUE(contains(draw_calls, "size"));
    EXPECT_EQ(symbol_calls(methods.at("size")), std::vector<std::string>{"compute"});
    EXPECT_TRUE(std::holds_alternative<std::string>(methods.at("compute")));
}

TEST(ParserTest, Cpp_FreeFunctionsAndIncludes) {
    ExtractedFile file = extract_source(Language::Cpp, CPP_SOURCE);

    ASSERT_EQ(file.functions.count("main"), 1u);
    EXPECT_EQ(symbol_calls(file.functions.at("main")), std::vector<std::string>{"draw"});
    EXPECT_EQ(file.functions.count("draw"), 0u);
    EXPECT_EQ(file.imports, (std::vector<std::string>{"vector", "./widget.hpp"}));
}

TEST(ParserTest, EmptySource_HasNoSymbols) {
    ExtractedFile file = extract_source(Language::Python, "");
    EXPECT_FALSE(file.has_symbols());
    EXPECT_TRUE(file.imports.empty());
}

TEST(ParserTest, UnknownLanguage_Throws) {
    EXPECT_THROW(extract_source(Language::Unknown, "int x;"), std::runtime_error);
    EXPECT_EQ(create_parser(Language::Unknown), nullptr);
}

TEST(ParserTest, JavaScript_FunctionsAndArrowBindings) {
    ExtractedFile file = extract_source(Language::JavaScript, JS_SOURCE);

    ASSERT_EQ(file.functions.count("render"), 1u);
    EXPECT_EQ(symbol_signature(file.functions.at("render")), "(items)");
    EXPECT_EQ(symbol_calls(file.functions.at("render")), std::vector<std::string>{"map"});
    ASSERT_EQ(file.functions.count("total"), 1u);
    EXPECT_EQ(symbol_calls(file.functions.at("total")), std::vector<std::string>{"sum"});
    ASSERT_EQ(file.functions.count("double"), 1u);
    EXPECT_EQ(symbol_signature(file.functions.at("double")), "(x)");
    EXPECT_EQ(file.functions.count("path"), 0u);
}

TEST(ParserTest, JavaScript_ExportedClassMethods) {
    ExtractedFile file = extract_source(Language::JavaScript, JS_SOURCE);

    ASSERT_EQ(file.classes.count("Cart"), 1u);
    const auto& methods = file.classes.at("Cart").methods;
    EXPECT_EQ(methods.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<std::string>(methods.at("constructor")));
    const auto& add_calls = symbol_calls(methods.at("add"));
    EXPECT_TRUE(contains(add_calls, "push"));
    EXPECT_TRUE(contains(add_calls, "Cart"));
}

TEST(ParserTest, JavaScript_ImportsRequiresAndReexports) {
    ExtractedFile file = extract_source(Language::JavaScript, JS_SOURCE);

    EXPECT_EQ(file.imports,
              (std::vector<std::string>{"react", "./format", "path", "../shared/index"}));
}
