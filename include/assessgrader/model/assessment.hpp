#pragma once

#include <assessgrader/common/expected.hpp>
#include <assessgrader/common/formatters/macros.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace assessgrader {

/// Order matches the alternatives of ``QuestionPayload``
enum class QuestionKind { McqSingle, McqMultiple, Coding, TextResponse, FileUpload };

struct McqOption
{
    std::string id;
    std::string text;

    bool operator==(const McqOption&) const = default;
};

struct TestCase
{
    std::string input;
    std::string expected_output;
    int points = 0;
    /// Hidden cases never reveal their input or expected output to the candidate
    bool hidden = false;

    bool operator==(const TestCase&) const = default;
};

struct McqSingle
{
    std::vector<McqOption> options;
    std::string correct_answer;
    bool randomize_options = false;

    bool operator==(const McqSingle&) const = default;
};

struct McqMultiple
{
    std::vector<McqOption> options;
    std::set<std::string> correct_answers;
    bool randomize_options = false;

    bool operator==(const McqMultiple&) const = default;
};

struct Coding
{
    std::string language;
    std::string starter_code;
    std::vector<TestCase> test_cases;
    std::chrono::milliseconds execution_timeout{std::chrono::seconds{10}};

    bool operator==(const Coding&) const = default;
};

struct TextResponse
{
    std::optional<std::size_t> max_length;

    bool operator==(const TextResponse&) const = default;
};

struct FileUpload
{
    /// Lowercase extensions without the dot. Empty means anything goes
    std::vector<std::string> allowed_file_types;
    int max_file_size_mb = 10;

    bool operator==(const FileUpload&) const = default;
};

using QuestionPayload = std::variant<McqSingle, McqMultiple, Coding, TextResponse, FileUpload>;

struct Question
{
    std::string id;
    std::string text;
    int points = 0;
    int display_order = 0;
    QuestionPayload payload;

    QuestionKind kind() const { return static_cast<QuestionKind>(payload.index()); }

    /// Options of an MCQ question, or nullptr for any other kind
    const std::vector<McqOption>* options() const;

    bool operator==(const Question&) const = default;
};

struct AntiCheatConfig
{
    bool track_tab_switches = true;
    int max_tab_switches = 3;
    bool track_ip_changes = true;

    bool operator==(const AntiCheatConfig&) const = default;
};

/// Immutable snapshot of an assessment as published by the management side
struct AssessmentDefinition
{
    static constexpr int MAX_QUESTION_POINTS = 1000;

    std::string id;
    std::string title;
    std::string description;

    /// Kept sorted by ``display_order``
    std::vector<Question> questions;

    /// Absent means untimed
    std::optional<std::chrono::minutes> time_limit;
    double passing_score_percentage = 70.0;
    bool randomize_questions = false;

    int max_attempts = 1;
    bool allow_retakes = false;
    bool show_correct_answers = false;
    std::chrono::seconds access_token_ttl = std::chrono::days{7};

    AntiCheatConfig anti_cheat;

    int total_points() const;

    const Question* find_question(std::string_view question_id) const;

    /// Sorts questions by display order. Called on publish
    void normalize();

    /// Returns a description of the first problem found
    Expected<void, std::string> validate() const;

    bool operator==(const AssessmentDefinition&) const = default;
};

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::QuestionKind, McqSingle, McqMultiple, Coding, TextResponse, FileUpload);
FMT_SERIALIZE_CLASS(::assessgrader::AntiCheatConfig, track_tab_switches, max_tab_switches, track_ip_changes);
