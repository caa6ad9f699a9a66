#ifndef COMMAND_BUS_H_
#define COMMAND_BUS_H_

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ToolCall.hpp"

namespace AVATAR {

    using ToolInvoker = std::function<void(const ToolCall&)>;

    // Sink used until a real one is installed: logs and drops the command.
    ToolInvoker LogToolInvoker();

    // Dispatch point for avatar commands. One instance per avatar session,
    // constructed by the host and passed by reference to whatever needs to
    // invoke or subscribe. Ready after construction, inert after Teardown().
    class CommandBus {
    public:
        static constexpr std::size_t kHistoryLimit = 256;

        explicit CommandBus(ToolInvoker sink = LogToolInvoker());

        CommandBus(const CommandBus&) = delete;
        CommandBus& operator=(const CommandBus&) = delete;

        // Records, notifies subscribers, then forwards to the sink. Sink and
        // subscriber failures are logged and never reach the caller.
        void Invoke(const ToolCall& call);

        // Normalizes a loosely shaped payload and invokes each command in
        // arrival order. Returns the number of commands invoked.
        std::size_t Process(const nlohmann::json& payload);
        std::size_t ProcessText(const std::string& text);

        // Flattens any accepted wire shape into candidate command objects.
        // Unrecognized shapes give an empty list.
        static std::vector<nlohmann::json> Normalize(const nlohmann::json& payload);

        int Subscribe(ToolInvoker listener);
        void Unsubscribe(int id);

        void SetSink(ToolInvoker sink);
        void Teardown();

        bool IsReady() const { return ready_; }
        const std::deque<ToolCall>& GetHistory() const { return history_; }
        // false when nothing was invoked yet.
        bool GetLastCall(ToolCall& call) const;

    private:
        static void CollectInto(const nlohmann::json& payload,
            std::vector<nlohmann::json>& out, int depth);

        bool ready_ = true;
        ToolInvoker sink_;
        std::vector<std::pair<int, ToolInvoker>> listeners_;
        int next_listener_id_ = 1;
        std::deque<ToolCall> history_;
    };

}  // namespace AVATAR

#endif
