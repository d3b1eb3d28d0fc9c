/********************************************************************
 * darija-core.cpp  –  darija core implementation.
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#include "libdarija/darija_core.h"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

// ICU includes for Unicode string handling and classification
#include <unicode/unistr.h>
#include <unicode/locid.h>
#include <unicode/utypes.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <unicode/utf16.h>

namespace fs = std::filesystem;

// =============================================================================//
// Standalone Function Implementations
// =============================================================================//

std::string getDarijaVersion() {
    // This macro is defined by the CMake build script
    return DARIJA_VERSION;
}

// ----------------- Character classification -----------------
inline bool isArabicBlock(UChar32 c) { return c >= 0x0600 && c <= 0x06FF; }

inline bool isArabicSupplement(UChar32 c) { return c >= 0x0750 && c <= 0x077F; }

inline bool isArabicExtendedA(UChar32 c) { return c >= 0x08A0 && c <= 0x08FF; }

inline bool isArabicPresentationForm(UChar32 c) {
    // Forms-A and Forms-B; U+FEFF in the same block is the BOM, not a letter
    return (c >= 0xFB50 && c <= 0xFDFF) || (c >= 0xFE70 && c <= 0xFEFC);
}

inline bool isArabicScriptChar(UChar32 c) {
    return isArabicBlock(c) || isArabicSupplement(c) || isArabicExtendedA(c) ||
           isArabicPresentationForm(c);
}

// White_Space plus the zero width no-break space, the same set chat text
// pipelines treat as blanks.
inline bool isTextWhitespace(UChar32 c) {
    return u_isUWhiteSpace(c) || c == 0xFEFF;
}

inline bool isTokenChar(char c) {
    // Printable ASCII without space, and no uppercase: tokens are matched
    // against lowercased text.
    return c > 0x20 && c < 0x7F && !(c >= 'A' && c <= 'Z');
}

// ----------------- Validation -----------------
bool isValidUtf8(const std::string& s) {
    if (s.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) return false;
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t length = static_cast<int32_t>(s.size());
    for (int32_t i = 0; i < length;) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) return false;
    }
    return true;
}

bool isArabicScriptText(const icu::UnicodeString& u) {
    if (u.isEmpty()) return false;
    for (int32_t i = 0; i < u.length();) {
        UChar32 c = u.char32At(i);
        if (!isArabicScriptChar(c)) return false;
        i += U16_LENGTH(c);
    }
    return true;
}

// ----------------- Overload for std::string -----------------
bool isArabicScriptText(const std::string& s) {
    if (!isValidUtf8(s)) return false;
    return isArabicScriptText(icu::UnicodeString::fromUTF8(s));
}


// =============================================================================//
// MappingTable Implementation
// =============================================================================//
MappingTable::MappingTable(std::vector<MappingEntry> entries) : entries_(std::move(entries)) {
    if (entries_.empty()) {
        throw std::runtime_error("Mapping table has no entries.");
    }

    std::unordered_set<std::string> seen;
    for (const auto& entry : entries_) {
        if (entry.token.empty()) {
            throw std::runtime_error("Mapping table contains an empty token.");
        }
        if (!std::all_of(entry.token.begin(), entry.token.end(), isTokenChar)) {
            throw std::runtime_error("Invalid token '" + entry.token +
                                     "': tokens must be lowercase printable ASCII.");
        }
        if (!seen.insert(entry.token).second) {
            throw std::runtime_error("Duplicate token in mapping table: " + entry.token);
        }
        if (!isArabicScriptText(entry.replacement)) {
            throw std::runtime_error("Replacement for token '" + entry.token +
                                     "' is not Arabic script text.");
        }

        if (entry.token.size() > 1) {
            multiChar_.push_back(entry);
        } else {
            singleChar_.push_back(entry);
        }
    }

    // Longest tokens first so a shorter token never breaks up a longer one.
    // stable_sort keeps insertion order between tokens of equal length.
    std::stable_sort(multiChar_.begin(), multiChar_.end(),
                     [](const MappingEntry& a, const MappingEntry& b) {
                         return a.token.size() > b.token.size();
                     });
}

const MappingEntry* MappingTable::find(const std::string& token) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&token](const MappingEntry& e) { return e.token == token; });
    return it != entries_.end() ? &*it : nullptr;
}

MappingTable MappingTable::fromToml(const std::string& content) {
    std::istringstream iss(content);
    std::string line, section;
    std::vector<MappingEntry> entries;
    auto unquote = [](std::string str) -> std::string {
        if (str.size() >= 2 && ((str.front() == '"' && str.back() == '"') ||
                                (str.front() == '\'' && str.back() == '\''))) {
            str = str.substr(1, str.size() - 2);
        }
        std::string result;
        for (size_t i = 0; i < str.size(); ++i) {
            if (str[i] == '\\' && i + 1 < str.size()) {
                char next = str[i + 1];
                if (next == '\\')
                    result += '\\';
                else if (next == 'n')
                    result += '\n';
                else if (next == 't')
                    result += '\t';
                else
                    result += next;
                ++i;
            } else {
                result += str[i];
            }
        }
        return result;
    };
    // Drops a trailing comment, ignoring '#' inside quotes.
    auto stripComment = [](const std::string& str) -> std::string {
        char quote = '\0';
        for (size_t i = 0; i < str.size(); ++i) {
            char c = str[i];
            if (quote) {
                if (c == '\\' && quote == '"') ++i;
                else if (c == quote) quote = '\0';
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#') {
                return str.substr(0, i);
            }
        }
        return str;
    };
    auto trim = [](std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    };
    while (std::getline(iss, line)) {
        line = stripComment(line);
        trim(line);
        if (line.empty())
            continue;
        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            trim(section);
            continue;
        }
        if (section != "charMap")
            continue;
        // Keys may be quoted and contain '=', so split after the key's closing quote.
        size_t searchFrom = 0;
        if (line[0] == '"' || line[0] == '\'') {
            size_t closing = line.find(line[0], 1);
            if (closing != std::string::npos) searchFrom = closing + 1;
        }
        size_t eqPos = line.find('=', searchFrom);
        if (eqPos == std::string::npos)
            continue;
        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trim(key);
        trim(value);
        entries.push_back({unquote(key), unquote(value)});
    }
    return MappingTable(std::move(entries));
}

MappingTable MappingTable::fromFile(const std::string& path) {
    fs::path fullPath = path;
    if (!fs::exists(fullPath)) {
        throw std::runtime_error("Could not locate mapping file: " + fullPath.string());
    }
    std::ifstream file(fullPath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open mapping file: " + fullPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromToml(buffer.str());
}

const MappingTable& builtinDarijaTable() {
    static const MappingTable table(std::vector<MappingEntry>{
        // Digits standing for sounds Latin script has no letter for
        {"3", "ع"},
        {"7", "ح"},
        {"9", "ق"},
        {"2", "ء"},
        {"5", "خ"},
        {"6", "ط"},
        {"8", "غ"},
        // Digraphs; several reuse the digits above, so they run first
        {"dh", "ذ"},
        {"d7", "ظ"},
        {"sh", "ش"},
        {"s5", "ص"},
        {"s9", "ص"},
        {"d9", "ض"},
        {"z7", "ز"},
    });
    return table;
}


// =============================================================================//
// Normalizer Implementation (PImpl Idiom)
// =============================================================================//
class Normalizer::Impl {
public:
    const MappingTable table_;

    explicit Impl(MappingTable table) : table_(std::move(table)) {}

    static MappingTable loadTable(const std::string& mappingFile) {
        if (mappingFile.empty()) {
            return builtinDarijaTable();
        }
        return MappingTable::fromFile(mappingFile);
    }

    std::string foldCase(const std::string& input) const;
    std::string applyMultiCharPass(std::string text) const;
    std::string applySingleCharPass(std::string text) const;
    std::string collapseWhitespace(const std::string& text) const;
    static void replaceAll(std::string& text, const std::string& token, const std::string& value);
};

// Public Normalizer methods forwarding to Impl

Normalizer::Normalizer(const std::string& mappingFile)
    : pImpl(std::make_unique<Impl>(Impl::loadTable(mappingFile))) {}
Normalizer::Normalizer(MappingTable table) : pImpl(std::make_unique<Impl>(std::move(table))) {}
Normalizer::~Normalizer() = default;

const MappingTable& Normalizer::table() const { return pImpl->table_; }

std::string Normalizer::normalize(const char* input) const {
    if (input == nullptr) {
        return "";
    }
    return normalize(std::string(input));
}

std::string Normalizer::normalize(const std::string& input) const {
    // Malformed bytes are not text; treat them like a missing argument.
    if (input.empty() || !isValidUtf8(input)) {
        return "";
    }
    std::string text = pImpl->foldCase(input);
    text = pImpl->applyMultiCharPass(std::move(text));
    text = pImpl->applySingleCharPass(std::move(text));
    return pImpl->collapseWhitespace(text);
}

long Normalizer::normalizeLines(std::istream& in, std::ostream& out,
                                std::vector<long>* malformedLines) const {
    long linesNormalized = 0;
    std::string line;
    while (std::getline(in, line)) {
        linesNormalized++;
        if (malformedLines && !isValidUtf8(line)) {
            malformedLines->push_back(linesNormalized);
        }
        // Empty results still get a line so output stays aligned with input
        out << normalize(line) << '\n';
    }
    out.flush();
    return linesNormalized;
}

std::string normalizeDarija(const std::string& text) {
    static const Normalizer normalizer;
    return normalizer.normalize(text);
}

std::string normalizeDarija(const char* text) {
    if (text == nullptr) {
        return "";
    }
    return normalizeDarija(std::string(text));
}


//  Full implementation of Normalizer::Impl methods
std::string Normalizer::Impl::foldCase(const std::string& input) const {
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(input);
    ustr.toLower(icu::Locale::getRoot());
    std::string folded;
    ustr.toUTF8String(folded);
    return folded;
}

void Normalizer::Impl::replaceAll(std::string& text, const std::string& token,
                                  const std::string& value) {
    size_t pos = text.find(token);
    if (pos == std::string::npos) return;

    // Built into a fresh buffer; replacing in place shifts the tail on every match.
    std::string result;
    size_t growth = value.size() > token.size() ? value.size() - token.size() : 0;
    result.reserve(text.size() + (text.size() / token.size()) * growth);
    size_t last = 0;
    while (pos != std::string::npos) {
        result.append(text, last, pos - last);
        result += value;
        last = pos + token.size();
        pos = text.find(token, last);
    }
    result.append(text, last, std::string::npos);
    text.swap(result);
}

// Tokens are ASCII and UTF-8 continuation bytes are all >= 0x80, so a byte
// search never matches inside a multi-byte character.
std::string Normalizer::Impl::applyMultiCharPass(std::string text) const {
    for (const auto& entry : table_.multiCharEntries()) {
        replaceAll(text, entry.token, entry.replacement);
    }
    return text;
}

std::string Normalizer::Impl::applySingleCharPass(std::string text) const {
    for (const auto& entry : table_.singleCharEntries()) {
        replaceAll(text, entry.token, entry.replacement);
    }
    return text;
}

std::string Normalizer::Impl::collapseWhitespace(const std::string& text) const {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(text);
    icu::UnicodeString collapsed;
    for (int32_t i = 0; i < u.length();) {
        UChar32 c = u.char32At(i);
        if (!isTextWhitespace(c)) {
            collapsed.append(c);
            i += U16_LENGTH(c);
            continue;
        }
        int32_t runStart = i;
        int runLength = 0;
        while (i < u.length() && isTextWhitespace(u.char32At(i))) {
            i += U16_LENGTH(u.char32At(i));
            ++runLength;
        }
        if (runLength > 1) {
            collapsed.append(static_cast<UChar32>(0x20));
        } else {
            // A single blank is kept as it is, only runs become one space
            collapsed.append(u, runStart, i - runStart);
        }
    }

    // Trim
    int32_t begin = 0;
    int32_t end = collapsed.length();
    while (begin < end && isTextWhitespace(collapsed.char32At(begin))) {
        begin += U16_LENGTH(collapsed.char32At(begin));
    }
    while (end > begin) {
        int32_t last = end;
        U16_BACK_1(collapsed.getBuffer(), begin, last);
        if (!isTextWhitespace(collapsed.char32At(last))) break;
        end = last;
    }

    std::string result;
    collapsed.tempSubStringBetween(begin, end).toUTF8String(result);
    return result;
}
