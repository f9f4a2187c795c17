#pragma once

#include "providers/provider.hpp"
#include <filesystem>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace talk::testing {

// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("ctalk_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Files in the directory, by name.
    std::vector<std::string> files() const {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            names.push_back(entry.path().filename().string());
        }
        return names;
    }

private:
    std::filesystem::path path_;
};

/**
 * Transport that replays a fixed list of events.
 *
 * Polls cancel_check before each event the way the network transport polls
 * between chunks. before_event runs before each event is delivered.
 */
class ScriptedTransport : public providers::ITransport {
public:
    std::vector<providers::StreamEvent> script;
    std::vector<providers::StreamRequest> requests;
    std::function<void(size_t)> before_event;

    void stream(const providers::StreamRequest& request,
                providers::OnEventCallback on_event,
                providers::CancelCallback cancel_check) override {
        requests.push_back(request);
        for (size_t i = 0; i < script.size(); ++i) {
            if (before_event) {
                before_event(i);
            }
            if (cancel_check && cancel_check()) {
                on_event(providers::StreamError{providers::FailureKind::Cancelled, "Cancelled"});
                return;
            }
            on_event(script[i]);
        }
    }

    std::string get_name() const override { return "Scripted"; }

    size_t calls() const { return requests.size(); }

    // Replaces the script with a successful reply made of the given fragments.
    void reply(const std::vector<std::string>& fragments, int64_t input_tokens, int64_t output_tokens) {
        script.clear();
        script.push_back(providers::UsageReport{{input_tokens, 1}});
        for (const auto& fragment : fragments) {
            script.push_back(providers::TextFragment{fragment});
        }
        script.push_back(providers::UsageReport{{input_tokens, output_tokens}});
        script.push_back(providers::StreamSuccess{});
    }
};

} // namespace talk::testing
