#include <grader/api/suite_builder.hpp>

#include <grader/core/suite.hpp>
#include <grader/core/test.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace grader {

TestBuilder& TestBuilder::only() {
    test_->mark_only();
    return *this;
}

TestBuilder& TestBuilder::skip() {
    test_->mark_pending();
    return *this;
}

TestBuilder& TestBuilder::timeout(std::chrono::milliseconds timeout) {
    test_->set_timeout(timeout);
    return *this;
}

TestBuilder& TestBuilder::slow(std::chrono::milliseconds slow) {
    test_->set_slow(slow);
    return *this;
}

TestBuilder& TestBuilder::retries(int retries) {
    test_->set_retries(retries);
    return *this;
}

TestBuilder& TestBuilder::description(std::string description) {
    test_->set_description(std::move(description));
    return *this;
}

SuiteBuilder SuiteBuilder::describe(std::string title, const std::function<void(SuiteBuilder&)>& declare) {
    SuiteBuilder child{suite_->create_child(std::move(title))};

    if (declare) {
        declare(child);
    }

    return child;
}

TestBuilder SuiteBuilder::it(std::string title) {
    return TestBuilder{suite_->add_test(std::move(title), std::nullopt)};
}

SuiteBuilder& SuiteBuilder::only() {
    suite_->mark_only();
    return *this;
}

SuiteBuilder& SuiteBuilder::skip() {
    suite_->mark_pending();
    return *this;
}

SuiteBuilder& SuiteBuilder::timeout(std::chrono::milliseconds timeout) {
    suite_->set_timeout(timeout);
    return *this;
}

SuiteBuilder& SuiteBuilder::slow(std::chrono::milliseconds slow) {
    suite_->set_slow(slow);
    return *this;
}

SuiteBuilder& SuiteBuilder::retries(int retries) {
    suite_->set_retries(retries);
    return *this;
}

SuiteBuilder& SuiteBuilder::handle(std::string handle) {
    suite_->set_handle(std::move(handle));
    return *this;
}

SuiteBuilder& SuiteBuilder::description(std::string description) {
    suite_->set_description(std::move(description));
    return *this;
}

SuiteBuilder& SuiteBuilder::tag(std::string tag) {
    suite_->add_tag(std::move(tag));
    return *this;
}

} // namespace grader
