#include "opsmcp/tool_registry.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <thread>

namespace opsmcp {

namespace {

// The worker owns the packaged_task, so the returned future never blocks
// in its destructor and an abandoned (timed out) call is simply left to finish.
AsyncToolHandler run_on_worker(ToolHandler handler) {
    return [handler = std::move(handler)](const nlohmann::json& arguments) {
        auto task = std::make_shared<std::packaged_task<CallToolResult()>>(
            [handler, arguments] { return handler(arguments); });
        auto fut = task->get_future();
        std::thread([task] { (*task)(); }).detach();
        return fut;
    };
}

} // anonymous namespace

void ToolRegistry::register_tool(ToolDefinition def, ToolHandler handler) {
    register_tool_async(std::move(def), run_on_worker(std::move(handler)));
}

void ToolRegistry::register_tool_async(ToolDefinition def, AsyncToolHandler handler) {
    std::string name = def.name;
    auto it = index_.find(name);
    if (it != index_.end()) {
        // Keep the original listing position
        descriptors_[it->second] = ToolDescriptor{std::move(def), std::move(handler)};
        spdlog::info("Replaced tool: {}", name);
        return;
    }
    index_.emplace(name, descriptors_.size());
    descriptors_.push_back(ToolDescriptor{std::move(def), std::move(handler)});
    spdlog::info("Registered tool: {}", name);
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &descriptors_[it->second];
}

bool ToolRegistry::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

std::vector<ToolDefinition> ToolRegistry::list() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(descriptors_.size());
    for (const auto& d : descriptors_) {
        defs.push_back(d.definition);
    }
    return defs;
}

} // namespace opsmcp
