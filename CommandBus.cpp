#include "CommandBus.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace AVATAR {

    using json = nlohmann::json;

    constexpr std::size_t CommandBus::kHistoryLimit;

    namespace {
        // Nested wrappers deeper than this are rejected rather than followed.
        const int kMaxNesting = 4;
    }

    ToolInvoker LogToolInvoker() {
        return [](const ToolCall& call) {
            std::cout << "[CommandBus] no sink installed, dropping "
                << ToString(call.type) << "\n";
        };
    }

    CommandBus::CommandBus(ToolInvoker sink)
        : sink_(std::move(sink)) {
        if (!sink_) {
            sink_ = LogToolInvoker();
        }
    }

    void CommandBus::Invoke(const ToolCall& call) {
        if (!ready_) {
            std::cerr << "[CommandBus] WARNING: invoke after teardown ignored ("
                << ToString(call.type) << ")\n";
            return;
        }

        std::cout << "[CommandBus] invoke " << ToJson(call).dump() << "\n";

        history_.push_back(call);
        while (history_.size() > kHistoryLimit) {
            history_.pop_front();
        }

        // Listeners may unsubscribe from inside the callback.
        std::vector<std::pair<int, ToolInvoker>> listeners = listeners_;
        for (const auto& entry : listeners) {
            try {
                entry.second(call);
            }
            catch (const std::exception& e) {
                std::cerr << "[CommandBus] ERROR: listener " << entry.first
                    << " failed: " << e.what() << "\n";
            }
            catch (...) {
                std::cerr << "[CommandBus] ERROR: listener " << entry.first
                    << " failed with a non-standard exception\n";
            }
        }

        try {
            sink_(call);
        }
        catch (const std::exception& e) {
            std::cerr << "[CommandBus] ERROR: sink failed for "
                << ToString(call.type) << ": " << e.what() << "\n";
        }
        catch (...) {
            std::cerr << "[CommandBus] ERROR: sink failed for "
                << ToString(call.type) << " with a non-standard exception\n";
        }
    }

    std::size_t CommandBus::Process(const json& payload) {
        if (!ready_) {
            std::cerr << "[CommandBus] WARNING: process after teardown ignored\n";
            return 0;
        }

        std::vector<json> candidates = Normalize(payload);
        if (candidates.empty()) {
            std::cerr << "[CommandBus] WARNING: payload carried no commands\n";
            return 0;
        }

        std::size_t invoked = 0;
        for (const json& candidate : candidates) {
            ToolCallParseResult result = TryParseToolCall(candidate);
            if (!result.IsOk()) {
                std::cerr << "[CommandBus] WARNING: dropping command: "
                    << result.Error().message << "\n";
                continue;
            }
            Invoke(result.Value());
            ++invoked;
        }
        return invoked;
    }

    std::size_t CommandBus::ProcessText(const std::string& text) {
        json payload = json::parse(text, nullptr, false);
        if (payload.is_discarded()) {
            std::cerr << "[CommandBus] WARNING: payload is not valid JSON\n";
            return 0;
        }
        return Process(payload);
    }

    std::vector<json> CommandBus::Normalize(const json& payload) {
        std::vector<json> out;
        CollectInto(payload, out, 0);
        return out;
    }

    void CommandBus::CollectInto(const json& payload, std::vector<json>& out, int depth) {
        if (depth > kMaxNesting || payload.is_null()) {
            return;
        }

        if (payload.is_array()) {
            for (const json& item : payload) {
                if (item.is_object() && item.contains("type")) {
                    out.push_back(item);
                }
            }
            return;
        }

        if (!payload.is_object()) {
            return;
        }

        if (payload.contains("type")) {
            out.push_back(payload);
            return;
        }

        // Speaker-status style envelope.
        auto call = payload.find("call");
        if (call != payload.end() && call->is_object()) {
            CollectInto(*call, out, depth + 1);
            return;
        }

        // Function-calling convention: arguments is a JSON string (or, from
        // lenient senders, an already decoded object).
        auto tool_calls = payload.find("tool_calls");
        if (tool_calls == payload.end() || !tool_calls->is_array()) {
            return;
        }
        for (const json& entry : *tool_calls) {
            if (!entry.is_object()) {
                continue;
            }
            auto fn = entry.find("function");
            if (fn == entry.end() || !fn->is_object()) {
                continue;
            }
            auto args = fn->find("arguments");
            if (args == fn->end()) {
                continue;
            }

            if (args->is_string()) {
                json parsed = json::parse(args->get<std::string>(), nullptr, false);
                if (parsed.is_discarded()) {
                    std::cerr << "[CommandBus] WARNING: malformed tool call arguments: "
                        << args->get<std::string>() << "\n";
                    continue;
                }
                CollectInto(parsed, out, depth + 1);
            }
            else if (args->is_object()) {
                CollectInto(*args, out, depth + 1);
            }
        }
    }

    int CommandBus::Subscribe(ToolInvoker listener) {
        if (!listener) {
            return 0;
        }
        int id = next_listener_id_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    void CommandBus::Unsubscribe(int id) {
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return;
            }
        }
    }

    void CommandBus::SetSink(ToolInvoker sink) {
        sink_ = sink ? std::move(sink) : LogToolInvoker();
    }

    void CommandBus::Teardown() {
        if (!ready_) {
            return;
        }
        std::cout << "[CommandBus] teardown after " << history_.size() << " commands\n";
        ready_ = false;
        listeners_.clear();
        sink_ = LogToolInvoker();
    }

    bool CommandBus::GetLastCall(ToolCall& call) const {
        if (history_.empty()) {
            return false;
        }
        call = history_.back();
        return true;
    }

}  // namespace AVATAR
