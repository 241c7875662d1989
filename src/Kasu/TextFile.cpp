// =================================================================
// src/Kasu/TextFile.cpp
// =================================================================
// Implementation for lossy UTF-8 file reading and text probing.

#include "Kasu/TextFile.hpp"
#include <cctype>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Kasu {

std::string TextFile::read(const fs::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        int error_number = errno != 0 ? errno : static_cast<int>(std::errc::io_error);
        throw fs::filesystem_error("Cannot open file", path,
                                   std::error_code(error_number, std::generic_category()));
    }

    std::ostringstream content_stream;
    content_stream << file.rdbuf();
    if (file.bad()) {
        throw fs::filesystem_error("Cannot read file", path,
                                   std::make_error_code(std::errc::io_error));
    }

    return decodeLossy(content_stream.str());
}

size_t TextFile::validSequenceLength(const std::string& bytes, size_t pos) {
    const auto byte_at = [&bytes](size_t index) {
        return static_cast<unsigned char>(bytes[index]);
    };
    const size_t remaining = bytes.size() - pos;
    const unsigned char lead = byte_at(pos);

    if (lead < 0x80) {
        return 1;
    }

    size_t length = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) min_second = 0xA0;      // overlong
        if (lead == 0xED) max_second = 0x9F;      // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) min_second = 0x90;      // overlong
        if (lead == 0xF4) max_second = 0x8F;      // above U+10FFFF
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }

    unsigned char second = byte_at(pos + 1);
    if (second < min_second || second > max_second) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        unsigned char continuation = byte_at(pos + i);
        if (continuation < 0x80 || continuation > 0xBF) {
            return 0;
        }
    }

    return length;
}

std::string TextFile::decodeLossy(const std::string& bytes) {
    std::string decoded;
    decoded.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t length = validSequenceLength(bytes, pos);
        if (length == 0) {
            ++pos;
            continue;
        }
        decoded.append(bytes, pos, length);
        pos += length;
    }

    return decoded;
}

bool TextFile::isText(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    char buffer[PROBE_SIZE];
    file.read(buffer, PROBE_SIZE);
    size_t bytes_read = static_cast<size_t>(file.gcount());
    if (bytes_read == 0) {
        return false;
    }

    std::string sample(buffer, bytes_read);

    // Null bytes are a strong binary indicator
    if (sample.find('\0') != std::string::npos) {
        return false;
    }

    // Valid UTF-8, tolerating a sequence cut off by the sample boundary
    size_t pos = 0;
    bool valid_utf8 = true;
    while (pos < sample.size()) {
        size_t length = validSequenceLength(sample, pos);
        if (length == 0) {
            if (bytes_read == PROBE_SIZE && sample.size() - pos < 4) {
                break;
            }
            valid_utf8 = false;
            break;
        }
        pos += length;
    }
    if (valid_utf8) {
        return true;
    }

    size_t printable_chars = 0;
    for (char c : sample) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isprint(uc) || std::isspace(uc)) {
            printable_chars++;
        }
    }

    // If more than 95% of characters are printable, consider it text
    return (static_cast<double>(printable_chars) / bytes_read) > 0.95;
}

size_t TextFile::countLines(const std::string& content) {
    size_t lines = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            lines++;
        } else if (content[i] == '\r' && (i + 1 >= content.size() || content[i + 1] != '\n')) {
            lines++;
        }
    }

    char last = content.empty() ? '\n' : content.back();
    if (last != '\n' && last != '\r') {
        lines++;
    }
    return lines;
}

size_t TextFile::countLinesInFile(const fs::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        int error_number = errno != 0 ? errno : static_cast<int>(std::errc::io_error);
        throw fs::filesystem_error("Cannot open file", path,
                                   std::error_code(error_number, std::generic_category()));
    }

    // Line terminators are ASCII, so counting on raw bytes matches the decoded text
    constexpr size_t chunk_size = 64 * 1024;
    char buffer[chunk_size];
    size_t lines = 0;
    char last = '\n';
    bool pending_cr = false;

    while (file.read(buffer, chunk_size) || file.gcount() > 0) {
        size_t count = static_cast<size_t>(file.gcount());
        for (size_t i = 0; i < count; ++i) {
            char c = buffer[i];
            if (pending_cr && c != '\n') {
                lines++;
            }
            pending_cr = (c == '\r');
            if (c == '\n') {
                lines++;
            }
            last = c;
        }
    }
    if (file.bad()) {
        throw fs::filesystem_error("Cannot read file", path,
                                   std::make_error_code(std::errc::io_error));
    }

    if (pending_cr) {
        lines++;
    }
    if (last != '\n' && last != '\r') {
        lines++;
    }
    return lines;
}

} // namespace Kasu
