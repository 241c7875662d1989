// =================================================================
// include/Kasu/LanguageMap.hpp
// =================================================================
// Header for mapping file names to Markdown code fence languages.

#pragma once

#include <string>

namespace Kasu {

class LanguageMap {
public:
    /**
     * @brief Get the code fence language tag for a file
     *
     * Well-known file names (Dockerfile, Makefile, .bashrc, ...) are checked
     * first, then the lower-cased extension. Unknown extensions yield the
     * extension without its dot; files without an extension yield "text".
     *
     * @param file_path File name or path
     * @return Language tag
     */
    static std::string getLanguage(const std::string& file_path);
};

} // namespace Kasu
