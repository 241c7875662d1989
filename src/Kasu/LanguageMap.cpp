// =================================================================
// src/Kasu/LanguageMap.cpp
// =================================================================
// Implementation for code fence language lookup.

#include "Kasu/LanguageMap.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace Kasu {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const std::unordered_map<std::string, std::string>& specialFiles() {
    static const std::unordered_map<std::string, std::string> files = {
        {"dockerfile", "dockerfile"},
        {"makefile", "makefile"},
        {"rakefile", "ruby"},
        {"gemfile", "ruby"},
        {"vagrantfile", "ruby"},
        {".bashrc", "bash"},
        {".zshrc", "zsh"},
        {".vimrc", "vim"},
        {".gitignore", "text"},
        {".dockerignore", "text"},
        {".npmrc", "text"},
        {".editorconfig", "ini"}
    };
    return files;
}

const std::unordered_map<std::string, std::string>& extensions() {
    static const std::unordered_map<std::string, std::string> languages = {
        // Python
        {".py", "python"}, {".pyi", "python"}, {".pyw", "python"},
        // JavaScript / TypeScript
        {".js", "javascript"}, {".jsx", "jsx"}, {".ts", "typescript"}, {".tsx", "tsx"},
        {".mjs", "javascript"}, {".cjs", "javascript"},
        // Web
        {".html", "html"}, {".htm", "html"}, {".css", "css"}, {".scss", "scss"},
        {".sass", "sass"}, {".less", "less"},
        // Markup and configuration
        {".json", "json"}, {".xml", "xml"}, {".yaml", "yaml"}, {".yml", "yaml"},
        {".toml", "toml"}, {".ini", "ini"}, {".cfg", "ini"}, {".conf", "conf"},
        // Shell
        {".sh", "bash"}, {".bash", "bash"}, {".zsh", "zsh"}, {".fish", "fish"},
        // C / C++
        {".c", "c"}, {".h", "c"}, {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"},
        {".hpp", "cpp"}, {".hxx", "cpp"},
        {".cs", "csharp"},
        {".java", "java"}, {".kt", "kotlin"}, {".kts", "kotlin"}, {".scala", "scala"},
        {".go", "go"},
        {".rs", "rust"},
        {".rb", "ruby"}, {".rake", "ruby"},
        {".php", "php"},
        {".swift", "swift"},
        {".r", "r"},
        {".md", "markdown"}, {".markdown", "markdown"},
        {".sql", "sql"},
        // Other
        {".txt", "text"}, {".log", "text"}, {".csv", "csv"},
        {".graphql", "graphql"}, {".proto", "protobuf"}
    };
    return languages;
}

} // namespace

std::string LanguageMap::getLanguage(const std::string& file_path) {
    std::filesystem::path path(file_path);

    std::string basename = toLower(path.filename().string());
    const auto& special = specialFiles();
    auto special_it = special.find(basename);
    if (special_it != special.end()) {
        return special_it->second;
    }

    std::string extension = toLower(path.extension().string());
    const auto& languages = extensions();
    auto language_it = languages.find(extension);
    if (language_it != languages.end()) {
        return language_it->second;
    }

    return extension.empty() ? "text" : extension.substr(1);
}

} // namespace Kasu
