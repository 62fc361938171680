#pragma once

#include "fsm.hh"
#include "patch.hh"
#include "shadow.hh"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sigrun {

enum class ViewState {
    // Waiting for the first full tree
    loading,
    // Container reflects the shadow tree and accepts updates
    joined,
    // Received invalid data. Must be joined again with a full tree.
    failed,
    // Torn down. Accepts nothing more.
    left,
};

enum class ViewEvent { join, update, leave };

// Client side of a mounted view: keeps the shadow copy of the server's tree
// and patches the container element with every wire value received
class LiveView {
public:
    // Invoked with the reason, when the view has failed and the server must
    // send a full tree again
    std::function<void(const std::string& reason)> on_remount;

    LiveView(Dom&, NodeRef container, HookRegistry* hooks = nullptr,
        Bindings = {});

    LiveView(const LiveView&) = delete;
    LiveView& operator=(const LiveView&) = delete;

    // Apply the full tree received on joining or rejoining.
    // Returns std::nullopt, if the view has left or the tree is invalid.
    std::optional<PatchReport> join(const nlohmann::json& rendered);

    // Apply a wire value received after joining.
    // Returns std::nullopt, if the view is not joined or the value is invalid.
    std::optional<PatchReport> update(const nlohmann::json& diff);

    // Destroy hooks, tear down nested views and stop accepting updates
    void leave();

    ViewState state() const { return fsm.state(); }

    NodeRef container() const { return root; }

    const Shadow& shadow() const { return _shadow; }

    Reconciler& reconciler() { return rec; }

    // Reason of the last failure
    const std::string& error() const { return _error; }

private:
    Reconciler rec;
    NodeRef root;
    Shadow _shadow;
    FSM<ViewState, ViewEvent> fsm;

    // Wire value being applied by the current transition
    const nlohmann::json* wire = nullptr;

    // Report of the last successful patch
    std::optional<PatchReport> report;

    std::string _error;

    // Merge the wire value into the shadow and patch the container.
    // Returns the next state.
    ViewState apply(bool full);

    std::optional<PatchReport> feed(ViewEvent, const nlohmann::json&);
};
}
