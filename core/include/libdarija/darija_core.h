/********************************************************************
 * darija-core.h  –  darija core header
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
#pragma once
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

// Only brings in the U_ICU_NAMESPACE macro, not the ICU string classes
#include <unicode/uversion.h>

// Forward declare ICU's UnicodeString to avoid including the full ICU header
namespace U_ICU_NAMESPACE {
class UnicodeString;
}

// =============================================================================//
// Standalone Functions
// =============================================================================//

/**
 * @brief Gets the version string of the libdarija library.
 * @return A string in "MAJOR.MINOR.PATCH" format.
 */
std::string getDarijaVersion();

/**
 * @brief Checks that a byte string is well-formed UTF-8.
 * @param s The bytes to check.
 * @return True if every sequence decodes to a Unicode scalar value.
 */
bool isValidUtf8(const std::string& s);

/**
 * @brief Checks that a string is non-empty and written only in Arabic script
 * (Arabic, Arabic Supplement, Arabic Extended-A and the presentation forms).
 * @param u The ICU UnicodeString to check.
 * @return True if every code point is an Arabic-script character.
 */
bool isArabicScriptText(const U_ICU_NAMESPACE::UnicodeString& u);

/**
 * @brief Convenience overload for isArabicScriptText that accepts a UTF-8 std::string.
 * @param s The UTF-8 encoded std::string to check.
 * @return True if the text is valid UTF-8 and entirely in Arabic script.
 */
bool isArabicScriptText(const std::string& s);


// =============================================================================//
// MappingTable Class
// =============================================================================//

/// One substitution rule: a lowercase ASCII token and its Arabic replacement.
struct MappingEntry {
    std::string token;
    std::string replacement;
};

/**
 * @brief Immutable ordered table of token-to-Arabic substitutions.
 *
 * Entries keep their insertion order. The table also keeps the two
 * application passes precomputed: tokens longer than one character sorted
 * by length (longest first, insertion order among equal lengths), then the
 * single-character tokens. A constructed table never changes.
 */
class MappingTable {
public:
    /**
     * @brief Builds and validates a table.
     * @param entries The rules in insertion order.
     * @throws std::runtime_error if the table is empty, a token is empty,
     * contains anything but lowercase printable ASCII, is duplicated, or a
     * replacement is not Arabic-script text.
     */
    explicit MappingTable(std::vector<MappingEntry> entries);

    /**
     * @brief Parses the [charMap] section of a mapping.toml document.
     * @param content The TOML text.
     * @return The table, in the order the keys appear.
     */
    static MappingTable fromToml(const std::string& content);

    /**
     * @brief Reads and parses a mapping.toml file.
     * @param path Path to the file.
     * @throws std::runtime_error if the file is missing or unreadable.
     */
    static MappingTable fromFile(const std::string& path);

    /** @brief All entries in insertion order. */
    const std::vector<MappingEntry>& entries() const { return entries_; }
    /** @brief Multi-character entries in the order they are applied. */
    const std::vector<MappingEntry>& multiCharEntries() const { return multiChar_; }
    /** @brief Single-character entries in the order they are applied. */
    const std::vector<MappingEntry>& singleCharEntries() const { return singleChar_; }

    /**
     * @brief Looks up a token.
     * @param token The literal token, e.g. "sh".
     * @return The entry, or nullptr if the token is not in the table.
     */
    const MappingEntry* find(const std::string& token) const;
    bool contains(const std::string& token) const { return find(token) != nullptr; }

    std::size_t size() const { return entries_.size(); }

private:
    std::vector<MappingEntry> entries_;
    std::vector<MappingEntry> multiChar_;
    std::vector<MappingEntry> singleChar_;
};

/**
 * @brief The Moroccan Darija chat-alphabet table compiled into the library.
 * Constructed on first use and kept for the lifetime of the process.
 */
const MappingTable& builtinDarijaTable();


// =============================================================================//
// Normalizer Class
// =============================================================================//

/**
 * @brief Rewrites Arabizi (Darija written with Latin letters and digits)
 * into Arabic script.
 *
 * normalize() lowercases the input, applies the multi-character tokens
 * longest first, then the single-character tokens, then collapses
 * whitespace runs and trims. It is const and safe to call from several
 * threads on the same instance.
 */
class Normalizer {
public:
    /**
     * @brief Constructs the normalizer.
     * @param mappingFile Optional path to a mapping.toml file. If empty, the
     * built-in Darija table is used.
     * @throws std::runtime_error if the mapping file cannot be loaded.
     */
    explicit Normalizer(const std::string& mappingFile = "");

    /**
     * @brief Constructs the normalizer over an already built table.
     */
    explicit Normalizer(MappingTable table);

    ~Normalizer();

    /**
     * @brief Normalizes a UTF-8 string.
     * @param input The Arabizi text.
     * @return The text in Arabic script. Empty input and input that is not
     * well-formed UTF-8 give an empty string. Never throws on bad input.
     */
    std::string normalize(const std::string& input) const;

    /** @brief As above; a null pointer gives an empty string. */
    std::string normalize(const char* input) const;

    /**
     * @brief Normalizes a stream line by line.
     * @param in Source text, one sentence per line.
     * @param out Receives one normalized line per input line. Lines that
     * normalize to empty are still written, so output stays aligned with input.
     * @param malformedLines If given, receives the 1-based numbers of input
     * lines that were emptied because they are not valid UTF-8.
     * @return The number of lines read.
     */
    long normalizeLines(std::istream& in, std::ostream& out,
                        std::vector<long>* malformedLines = nullptr) const;

    /** @brief The read-only table this normalizer applies. */
    const MappingTable& table() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Normalizes text with the built-in Darija table.
 * @param text The Arabizi text.
 * @return The text in Arabic script, or an empty string for empty or
 * malformed input.
 */
std::string normalizeDarija(const std::string& text);
std::string normalizeDarija(const char* text);
