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
#pragma once

#include <upserve/config.h>

#include <array>
#include <span>
#include <string>
#include <string_view>

/*!
 * \file
 * \brief Defines the capability descriptor shared by problems and solvers.
 */
namespace Upserve {
/*!
 * \defgroup kind Capabilities
 * \brief Feature sets describing what a problem requires or a solver supports.
 * @{
 */

//! Capability categories.
enum class Category : uint8_t {
    problem_class   = 0,
    time            = 1,
    numbers         = 2,
    conditions_kind = 3,
    effects_kind    = 4,
    typing          = 5,
    fluents_type    = 6,
    quality_metrics = 7,
};
inline constexpr uint32_t num_categories = 8;

//! A set of feature tags per capability category.
/*!
 * A ProblemKind is used in two directions: a problem states the features it
 * requires and a solver advertises the features it supports. Tags are taken
 * from a closed vocabulary per category, unknown tags are rejected.
 *
 * A category can be absent, present but empty, or present with a non-empty set
 * of tags. An absent category asserts nothing, while a present but empty one
 * explicitly states that no feature of that category is involved.
 *
 * Kinds are built with set() and then frozen. Modifying a frozen kind is a
 * precondition violation.
 */
class ProblemKind {
public:
    using TagSet = uint32_t;

    constexpr ProblemKind() = default;

    //! Adds the feature given in the form "CATEGORY:TAG".
    /*!
     * The form "CATEGORY:{}" marks the category as present without adding a tag.
     */
    ProblemKind& set(std::string_view feature);
    //! Adds tag to the given category.
    /*!
     * \throw std::invalid_argument if category or tag is not part of the vocabulary.
     * \pre not frozen()
     */
    ProblemKind& set(std::string_view category, std::string_view tag);
    ProblemKind& set(Category c, std::string_view tag);
    //! Marks c as present without adding any tag.
    ProblemKind& setCategory(Category c);

    ProblemKind& setProblemClass(std::string_view tag) { return set(Category::problem_class, tag); }
    ProblemKind& setTime(std::string_view tag) { return set(Category::time, tag); }
    ProblemKind& setNumbers(std::string_view tag) { return set(Category::numbers, tag); }
    ProblemKind& setConditionsKind(std::string_view tag) { return set(Category::conditions_kind, tag); }
    ProblemKind& setEffectsKind(std::string_view tag) { return set(Category::effects_kind, tag); }
    ProblemKind& setTyping(std::string_view tag) { return set(Category::typing, tag); }
    ProblemKind& setFluentsType(std::string_view tag) { return set(Category::fluents_type, tag); }
    ProblemKind& setQualityMetrics(std::string_view tag) { return set(Category::quality_metrics, tag); }

    //! Ends the builder phase.
    ProblemKind&       freeze();
    [[nodiscard]] bool frozen() const { return frozen_; }

    [[nodiscard]] bool   hasCategory(Category c) const;
    [[nodiscard]] bool   has(Category c, std::string_view tag) const;
    [[nodiscard]] TagSet tags(Category c) const { return tags_[index(c)]; }
    //! Returns true if no category is present.
    [[nodiscard]] bool     empty() const { return present_ == 0; }
    [[nodiscard]] uint32_t numFeatures() const;

    //! Returns true if every category present in this kind has its tags contained in the same category of other.
    /*!
     * Categories absent in this kind impose no constraint while categories absent
     * in other are treated as empty sets.
     */
    [[nodiscard]] bool subsumedBy(const ProblemKind& other) const;
    //! Returns true if a solver advertising this kind can handle problems of the given kind.
    [[nodiscard]] bool supports(const ProblemKind& problem) const { return problem.subsumedBy(*this); }

    //! Returns the features of this kind that are not part of other.
    [[nodiscard]] ProblemKind difference(const ProblemKind& other) const;

    //! Returns the features as a comma separated list of "CATEGORY:TAG" items.
    /*!
     * A present but empty category is written as "CATEGORY:{}". Each item is
     * accepted by set(std::string_view).
     */
    [[nodiscard]] std::string toString() const;

    //! Calls f(category, tag) for each feature and f(category, nullptr) for each present but empty category.
    template <typename F>
    void forEach(F&& f) const {
        for (uint32_t c = 0; c != num_categories; ++c) {
            if (not hasCategory(static_cast<Category>(c))) {
                continue;
            }
            auto voc = vocabulary(static_cast<Category>(c));
            if (tags_[c] == 0) {
                f(static_cast<Category>(c), static_cast<const char*>(nullptr));
            }
            for (uint32_t t = 0; t != voc.size(); ++t) {
                if ((tags_[c] >> t) & 1u) {
                    f(static_cast<Category>(c), voc[t]);
                }
            }
        }
    }

    friend bool operator<=(const ProblemKind& lhs, const ProblemKind& rhs) { return lhs.subsumedBy(rhs); }
    friend bool operator==(const ProblemKind& lhs, const ProblemKind& rhs) {
        return lhs.present_ == rhs.present_ && lhs.tags_ == rhs.tags_;
    }

    //! Returns the name of the given category, e.g. "TYPING".
    static const char* categoryName(Category c);
    //! Returns the tags known for the given category.
    static std::span<const char* const> vocabulary(Category c);
    //! Converts name into a category.
    static bool findCategory(std::string_view name, Category& out);
    //! Converts tag into its position in the vocabulary of c.
    static bool findTag(Category c, std::string_view tag, uint32_t& out);

private:
    static constexpr uint32_t index(Category c) { return static_cast<uint32_t>(c); }
    std::array<TagSet, num_categories> tags_{};
    uint32_t                           present_{0};
    bool                               frozen_{false};
};
//@}
} // namespace Upserve
