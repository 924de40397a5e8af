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
#include <upserve/problem_kind.h>

#include <potassco/bits.h>
#include <potassco/error.h>

#include <bit>

namespace Upserve {
namespace {
constexpr const char* problem_class_tags[] = {"ACTION_BASED", "HIERARCHICAL"};
constexpr const char* time_tags[]          = {"CONTINUOUS_TIME",
                                              "DISCRETE_TIME",
                                              "INTERMEDIATE_CONDITIONS_AND_EFFECTS",
                                              "TIMED_EFFECT",
                                              "TIMED_GOALS",
                                              "DURATION_INEQUALITIES"};
constexpr const char* numbers_tags[]       = {"CONTINUOUS_NUMBERS", "DISCRETE_NUMBERS"};
constexpr const char* conditions_tags[]    = {"NEGATIVE_CONDITIONS", "DISJUNCTIVE_CONDITIONS", "EQUALITY",
                                              "EXISTENTIAL_CONDITIONS", "UNIVERSAL_CONDITIONS"};
constexpr const char* effects_tags[]       = {"CONDITIONAL_EFFECTS", "INCREASE_EFFECTS", "DECREASE_EFFECTS"};
constexpr const char* typing_tags[]        = {"FLAT_TYPING", "HIERARCHICAL_TYPING"};
constexpr const char* fluents_tags[]       = {"NUMERIC_FLUENTS", "OBJECT_FLUENTS"};
constexpr const char* metrics_tags[]       = {"ACTIONS_COST", "PLAN_LENGTH", "FINAL_VALUE"};
constexpr std::string_view empty_tag_s = "{}"; // category present without any tag

struct CategoryDesc {
    const char*                  name;
    std::span<const char* const> tags;
};
constexpr CategoryDesc categories_g[num_categories] = {
    {"PROBLEM_CLASS", problem_class_tags}, {"TIME", time_tags},
    {"NUMBERS", numbers_tags},             {"CONDITIONS_KIND", conditions_tags},
    {"EFFECTS_KIND", effects_tags},        {"TYPING", typing_tags},
    {"FLUENTS_TYPE", fluents_tags},        {"QUALITY_METRICS", metrics_tags},
};
static_assert(std::size(time_tags) <= 32, "too many tags for TagSet");

std::string_view trim(std::string_view s) {
    while (not s.empty() && (s.front() == ' ' || s.front() == '\t')) { s.remove_prefix(1); }
    while (not s.empty() && (s.back() == ' ' || s.back() == '\t')) { s.remove_suffix(1); }
    return s;
}
} // namespace

const char* ProblemKind::categoryName(Category c) { return categories_g[index(c)].name; }
std::span<const char* const> ProblemKind::vocabulary(Category c) { return categories_g[index(c)].tags; }

bool ProblemKind::findCategory(std::string_view name, Category& out) {
    for (uint32_t i = 0; i != num_categories; ++i) {
        if (name == categories_g[i].name) {
            out = static_cast<Category>(i);
            return true;
        }
    }
    return false;
}
bool ProblemKind::findTag(Category c, std::string_view tag, uint32_t& out) {
    auto voc = vocabulary(c);
    for (uint32_t i = 0; i != voc.size(); ++i) {
        if (tag == voc[i]) {
            out = i;
            return true;
        }
    }
    return false;
}

ProblemKind& ProblemKind::set(std::string_view feature) {
    auto sep = feature.find(':');
    POTASSCO_CHECK(sep != std::string_view::npos, std::errc::invalid_argument,
                   "invalid feature '%.*s': 'CATEGORY:TAG' expected", static_cast<int>(feature.size()),
                   feature.data());
    auto category = trim(feature.substr(0, sep));
    auto tag      = trim(feature.substr(sep + 1));
    if (tag == empty_tag_s) {
        Category c;
        POTASSCO_CHECK(findCategory(category, c), std::errc::invalid_argument, "unknown category '%.*s'",
                       static_cast<int>(category.size()), category.data());
        return setCategory(c);
    }
    return set(category, tag);
}
ProblemKind& ProblemKind::set(std::string_view category, std::string_view tag) {
    Category c;
    POTASSCO_CHECK(findCategory(category, c), std::errc::invalid_argument, "unknown category '%.*s'",
                   static_cast<int>(category.size()), category.data());
    return set(c, tag);
}
ProblemKind& ProblemKind::set(Category c, std::string_view tag) {
    POTASSCO_CHECK_PRE(not frozen_, "problem kind is frozen");
    uint32_t bit;
    POTASSCO_CHECK(findTag(c, tag, bit), std::errc::invalid_argument, "unknown feature '%.*s' in category '%s'",
                   static_cast<int>(tag.size()), tag.data(), categoryName(c));
    Potassco::store_set_bit(present_, index(c));
    Potassco::store_set_bit(tags_[index(c)], bit);
    return *this;
}
ProblemKind& ProblemKind::setCategory(Category c) {
    POTASSCO_CHECK_PRE(not frozen_, "problem kind is frozen");
    Potassco::store_set_bit(present_, index(c));
    return *this;
}
ProblemKind& ProblemKind::freeze() {
    frozen_ = true;
    return *this;
}

bool ProblemKind::hasCategory(Category c) const { return Potassco::test_bit(present_, index(c)); }
bool ProblemKind::has(Category c, std::string_view tag) const {
    uint32_t bit;
    return findTag(c, tag, bit) && Potassco::test_bit(tags_[index(c)], bit);
}
uint32_t ProblemKind::numFeatures() const {
    uint32_t n = 0;
    for (auto t : tags_) { n += static_cast<uint32_t>(std::popcount(t)); }
    return n;
}

bool ProblemKind::subsumedBy(const ProblemKind& other) const {
    for (uint32_t c = 0; c != num_categories; ++c) {
        if (Potassco::test_bit(present_, c) && (tags_[c] & ~other.tags_[c]) != 0) {
            return false;
        }
    }
    return true;
}

ProblemKind ProblemKind::difference(const ProblemKind& other) const {
    ProblemKind res;
    for (uint32_t c = 0; c != num_categories; ++c) {
        if (auto missing = tags_[c] & ~other.tags_[c]; missing != 0) {
            Potassco::store_set_bit(res.present_, c);
            res.tags_[c] = missing;
        }
    }
    return res.freeze();
}

std::string ProblemKind::toString() const {
    std::string out;
    forEach([&out](Category c, const char* tag) {
        if (not out.empty()) {
            out += ',';
        }
        out.append(categoryName(c)).append(":").append(tag ? std::string_view(tag) : empty_tag_s);
    });
    return out;
}

} // namespace Upserve
