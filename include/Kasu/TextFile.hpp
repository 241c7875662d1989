// =================================================================
// include/Kasu/TextFile.hpp
// =================================================================
// Helpers for reading source files as lossily decoded UTF-8 text.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace Kasu {

class TextFile {
public:
    /**
     * @brief Read a whole file and drop every byte that is not valid UTF-8
     * @param path File to read
     * @return Decoded content
     * @throws std::filesystem::filesystem_error if the file cannot be opened or read
     */
    static std::string read(const std::filesystem::path& path);

    /**
     * @brief Remove invalid UTF-8 sequences from a byte string
     * @param bytes Raw bytes
     * @return Valid UTF-8 text
     */
    static std::string decodeLossy(const std::string& bytes);

    /**
     * @brief Probe the first bytes of a file to decide whether it is text
     *
     * Empty and unreadable files, and files containing NUL bytes, are not
     * text. Otherwise the sample must be valid UTF-8 or mostly printable.
     *
     * @param path File to probe
     * @return true if the file looks like text
     */
    static bool isText(const std::filesystem::path& path);

    /**
     * @brief Count lines the way a line-by-line reader would
     *
     * "\n", "\r\n" and a lone "\r" end a line; a non-empty last line without
     * a terminator still counts.
     *
     * @param content Decoded text
     * @return Number of lines
     */
    static size_t countLines(const std::string& content);

    /**
     * @brief Count the lines of a file without loading it at once
     * @param path File to read
     * @return Number of lines, counted like countLines()
     * @throws std::filesystem::filesystem_error if the file cannot be opened or read
     */
    static size_t countLinesInFile(const std::filesystem::path& path);

    static constexpr size_t PROBE_SIZE = 2048;

private:
    /**
     * @brief Length of the valid UTF-8 sequence starting at pos
     * @return Sequence length, or 0 if the bytes at pos are invalid
     */
    static size_t validSequenceLength(const std::string& bytes, size_t pos);
};

} // namespace Kasu
