#include "live_view.hh"
#include "console.hh"
#include "errors.hh"
#include "serializer.hh"

namespace sigrun {

LiveView::LiveView(Dom& dom, NodeRef container, HookRegistry* hooks, Bindings b)
    : rec(dom, hooks, std::move(b))
    , root(container)
    , fsm(ViewState::loading)
{
    for (auto s : { ViewState::loading, ViewState::joined, ViewState::failed }) {
        fsm.act(s, ViewEvent::join, [this] { return apply(true); });
    }
    fsm.act(ViewState::joined, ViewEvent::update, [this] { return apply(false); });

    fsm.wild_act(ViewEvent::leave, [this] {
        if (!fsm.is(ViewState::left)) {
            rec.teardown(root);
            _shadow.clear();
        }
        return ViewState::left;
    });

    fsm.on(ViewState::failed, [this] {
        console::warn("view failed, remounting: " + _error);
        if (on_remount) {
            on_remount(_error);
        }
    });
}

ViewState LiveView::apply(bool full)
{
    try {
        if (full && !is_full(*wire)) {
            throw DecodeError("join: expected a full tree");
        }
        _shadow.merge(*wire);
        report = rec.patch(root, _shadow.html(), _shadow.streams());

        // Stream items now live only in the DOM
        _shadow.prune_streams();
        if (fsm.is(ViewState::failed)) {
            console::log("view rejoined after failure: " + _error);
        }
        return ViewState::joined;
    } catch (const Error& ex) {
        _error = ex.what();
        _shadow.clear();
        if (fsm.is(ViewState::failed)) {
            // No state change, so the arrival handler will not run again
            console::warn("view failed again: " + _error);
        }
        return ViewState::failed;
    }
}

std::optional<PatchReport> LiveView::feed(
    ViewEvent ev, const nlohmann::json& val)
{
    report = std::nullopt;
    wire = &val;
    const bool handled = fsm.feed(ev);
    wire = nullptr;
    if (!handled) {
        console::warn("view can not accept data in its current state");
        return std::nullopt;
    }
    return std::move(report);
}

std::optional<PatchReport> LiveView::join(const nlohmann::json& rendered)
{
    return feed(ViewEvent::join, rendered);
}

std::optional<PatchReport> LiveView::update(const nlohmann::json& diff)
{
    return feed(ViewEvent::update, diff);
}

void LiveView::leave() { fsm.feed(ViewEvent::leave); }
}
