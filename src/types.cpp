#include "projmap/types.hpp"
#include <unordered_map>

namespace projmap {

static const std::unordered_map<std::string, std::string> &code_languages() {
    static const std::unordered_map<std::string, std::string> languages = {
        {".py", "python"},       {".js", "javascript"}, {".jsx", "javascript"},
        {".mjs", "javascript"},  {".cjs", "javascript"},
        {".ts", "typescript"},   {".tsx", "typescript"}, {".go", "go"},
        {".rs", "rust"},         {".java", "java"},     {".kt", "kotlin"},
        {".scala", "scala"},     {".c", "c"},           {".h", "c"},
        {".cpp", "cpp"},         {".cc", "cpp"},        {".cxx", "cpp"},
        {".hpp", "cpp"},         {".hh", "cpp"},        {".hxx", "cpp"},
        {".cs", "csharp"},       {".rb", "ruby"},       {".php", "php"},
        {".swift", "swift"},     {".sh", "shell"},      {".bash", "shell"},
        {".sql", "sql"},         {".lua", "lua"},       {".r", "r"},
        {".R", "r"},             {".m", "objc"},        {".mm", "objc"},
        {".vue", "vue"},         {".svelte", "svelte"}, {".dart", "dart"},
        {".ex", "elixir"},       {".exs", "elixir"},    {".erl", "erlang"},
        {".hs", "haskell"},      {".ml", "ocaml"},      {".zig", "zig"},
        {".pl", "perl"},         {".jl", "julia"}};
    return languages;
}

std::string language_name(const std::string &ext) {
    auto it = code_languages().find(ext);
    return it != code_languages().end() ? it->second : "";
}

bool is_code_extension(const std::string &ext) {
    return code_languages().count(ext) > 0;
}

bool is_markdown_extension(const std::string &ext) {
    return ext == ".md" || ext == ".markdown";
}

} // namespace projmap
