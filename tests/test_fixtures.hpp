#pragma once

#include "common/error_types.hpp"
#include "common/time.hpp"
#include "model/assessment.hpp"
#include "sandbox/execution.hpp"
#include "sandbox/sandbox_backend.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace testing {

/// Clock that only moves when told to
class ManualClock
{
public:
    ManualClock()
        : now_{std::make_shared<std::atomic<assessgrader::TimePoint>>(
              assessgrader::TimePoint{std::chrono::sys_days{std::chrono::year{2024} / 5 / 1}})} {}

    assessgrader::ClockFn fn() const {
        return [now = now_] { return now->load(); };
    }

    void advance(std::chrono::seconds by) { now_->store(now_->load() + by); }

    assessgrader::TimePoint now() const { return now_->load(); }

private:
    std::shared_ptr<std::atomic<assessgrader::TimePoint>> now_;
};

/// Backend whose behaviour is a callback; counts calls
class FakeBackend : public assessgrader::SandboxBackend
{
public:
    using Behaviour = std::function<assessgrader::Result<assessgrader::ExecutionResult>(
        const assessgrader::ExecutionRequest&, std::stop_token)>;

    FakeBackend(std::string name, std::vector<std::string> langs, Behaviour behaviour)
        : name_{std::move(name)}
        , langs_{std::move(langs)}
        , behaviour_{std::move(behaviour)} {}

    std::string_view name() const override { return name_; }

    std::vector<std::string> languages() const override { return langs_; }

    assessgrader::Result<assessgrader::ExecutionResult> execute(const assessgrader::ExecutionRequest& request,
                                                                std::stop_token stop) override {
        ++calls;
        auto res = behaviour_(request, std::move(stop));
        if (res) {
            res->backend = name_;
        }
        return res;
    }

    std::atomic<int> calls{0};

private:
    std::string name_;
    std::vector<std::string> langs_;
    Behaviour behaviour_;
};

inline assessgrader::ExecutionResult success(std::string out) {
    assessgrader::ExecutionResult res;
    res.status = assessgrader::ExecutionStatus::Success;
    res.stdout_text = std::move(out);
    return res;
}

/// "Runs" code by echoing it with the input appended, so tests can steer the output through the code
inline std::shared_ptr<FakeBackend> echo_backend(std::string name = "echo") {
    return std::make_shared<FakeBackend>(
        std::move(name), std::vector<std::string>{"python"},
        [](const assessgrader::ExecutionRequest& req, std::stop_token /*stop*/)
            -> assessgrader::Result<assessgrader::ExecutionResult> {
            if (req.code == "syntax error") {
                return assessgrader::ExecutionResult::failed(assessgrader::ExecutionFailure::CompileError,
                                                             "SyntaxError: invalid syntax");
            }
            return success(req.code + req.stdin_text + "\n");
        });
}

inline assessgrader::Question mcq_single(std::string id, int points, std::string correct = "b") {
    using namespace assessgrader;
    return Question{.id = std::move(id),
                    .text = "Pick one",
                    .points = points,
                    .display_order = 0,
                    .payload = McqSingle{.options = {{"a", "A"}, {"b", "B"}, {"c", "C"}},
                                         .correct_answer = std::move(correct),
                                         .randomize_options = false}};
}

inline assessgrader::Question mcq_multiple(std::string id, int points) {
    using namespace assessgrader;
    return Question{.id = std::move(id),
                    .text = "Pick all that apply",
                    .points = points,
                    .display_order = 0,
                    .payload = McqMultiple{.options = {{"a", "A"}, {"b", "B"}, {"c", "C"}, {"d", "D"}},
                                           .correct_answers = {"a", "b"},
                                           .randomize_options = false}};
}

/// Two test cases worth 5 each, the second one hidden. Expected outputs are "x1" and "x2"
inline assessgrader::Question coding(std::string id) {
    using namespace assessgrader;
    return Question{.id = std::move(id),
                    .text = "Print x followed by the input",
                    .points = 10,
                    .display_order = 0,
                    .payload = Coding{.language = "python",
                                      .starter_code = "",
                                      .test_cases = {{.input = "1", .expected_output = "x1", .points = 5, .hidden = false},
                                                     {.input = "2", .expected_output = "x2", .points = 5, .hidden = true}},
                                      .execution_timeout = std::chrono::seconds{2}}};
}

inline assessgrader::Question text_question(std::string id, int points) {
    using namespace assessgrader;
    return Question{.id = std::move(id),
                    .text = "Explain",
                    .points = points,
                    .display_order = 0,
                    .payload = TextResponse{.max_length = 20}};
}

/// q1: mcq single (10), q2: mcq multiple (10), q3: coding (10), q4: text (10)
inline assessgrader::AssessmentDefinition sample_definition(std::string id = "quiz") {
    using namespace assessgrader;
    AssessmentDefinition def;
    def.id = std::move(id);
    def.title = "Sample";
    def.questions = {mcq_single("q1", 10), mcq_multiple("q2", 10), coding("q3"), text_question("q4", 10)};
    for (int i = 0; i < static_cast<int>(def.questions.size()); ++i) {
        def.questions[static_cast<std::size_t>(i)].display_order = i + 1;
    }
    def.passing_score_percentage = 50.0;
    return def;
}

} // namespace testing
