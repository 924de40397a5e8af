//
// Copyright (c) 2024-present, The upserve authors
//
// This file is part of upserve.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#include <upserve/problem.h>

#include <potassco/error.h>

#include <filesystem>
#include <fstream>
#include <istream>

namespace Upserve {
namespace {
constexpr std::string_view magic_s = "upp";

bool isSpace(char c) { return c == ' ' || c == '\t' || c == '\r'; }

// Splits the next whitespace separated word from line.
std::string_view nextWord(std::string_view& line) {
    while (not line.empty() && isSpace(line.front())) { line.remove_prefix(1); }
    auto end = std::size_t{0};
    while (end != line.size() && not isSpace(line[end])) { ++end; }
    auto word = line.substr(0, end);
    line.remove_prefix(end);
    return word;
}

class ProblemReader {
public:
    explicit ProblemReader(std::istream& in) : in_(in) {}
    // <envelope> ::= "upp" <version> <EOL> { <directive> <EOL> } [ "begin" <EOL> <body> ]
    void parse(Problem& out);
    // Skips comments and empty lines; returns false on eof.
    bool nextLine(std::string_view& line);

private:
    void require(bool cond, const char* msg) const {
        POTASSCO_CHECK(cond, std::errc::not_supported, "parse error in line %u: %s", line_, msg);
    }
    void parseKind(std::string_view line, ProblemKind& kind) const;

    std::istream& in_;
    std::string   buffer_;
    uint32_t      line_{0};
};

bool ProblemReader::nextLine(std::string_view& line) {
    while (std::getline(in_, buffer_)) {
        ++line_;
        line = buffer_;
        while (not line.empty() && isSpace(line.back())) { line.remove_suffix(1); }
        while (not line.empty() && isSpace(line.front())) { line.remove_prefix(1); }
        if (not line.empty() && line.front() != '%') {
            return true;
        }
    }
    return false;
}

void ProblemReader::parse(Problem& out) {
    std::string_view line;
    require(nextLine(line), "unexpected end of input - problem header expected");
    require(nextWord(line) == magic_s, "unrecognized input format - 'upp' expected");
    auto version = nextWord(line);
    require(version == "1", "unsupported envelope version");
    require(nextWord(line).empty(), "invalid extra characters in header line");
    bool named = false;
    while (nextLine(line)) {
        auto directive = nextWord(line);
        if (directive == "begin") {
            require(nextWord(line).empty(), "invalid extra characters after 'begin'");
            out.body = line_ + 1;
            break;
        }
        if (directive == "name") {
            require(not named, "duplicate 'name' directive");
            auto name = nextWord(line);
            require(not name.empty() && nextWord(line).empty(), "invalid 'name' directive - identifier expected");
            out.name = name;
            named    = true;
        }
        else if (directive == "kind") {
            parseKind(line, out.kind);
        }
        else {
            require(false, "unknown directive - 'name', 'kind', or 'begin' expected");
        }
    }
    out.kind.freeze();
}

// <kind> ::= "kind" <CATEGORY> { <TAG> }
void ProblemReader::parseKind(std::string_view line, ProblemKind& kind) const {
    auto     category = nextWord(line);
    Category c;
    require(not category.empty(), "invalid 'kind' directive - category expected");
    POTASSCO_CHECK(ProblemKind::findCategory(category, c), std::errc::invalid_argument,
                   "line %u: unknown category '%.*s'", line_, static_cast<int>(category.size()), category.data());
    kind.setCategory(c);
    for (auto tag = nextWord(line); not tag.empty(); tag = nextWord(line)) { kind.set(c, tag); }
}
} // namespace

bool isProblemEnvelope(std::istream& in) {
    auto          pos = in.tellg();
    ProblemReader reader(in);
    bool          res = false;
    if (std::string_view line; reader.nextLine(line)) {
        res = nextWord(line) == magic_s;
    }
    in.clear();
    in.seekg(pos);
    return res;
}

Problem readProblem(std::istream& in, const std::string& locator) {
    Problem res;
    res.locator = locator;
    ProblemReader(in).parse(res);
    if (res.name.empty()) {
        res.name = std::filesystem::path(locator).stem().string();
    }
    return res;
}

Problem loadProblem(const std::string& locator) {
    std::ifstream file(locator);
    POTASSCO_CHECK(file.is_open(), std::errc::no_such_file_or_directory, "Can not read from '%s'!", locator.c_str());
    return readProblem(file, locator);
}

} // namespace Upserve
