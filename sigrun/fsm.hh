#pragma once

#include <functional>
#include <map>
#include <type_traits>
#include <utility>
#include <vector>

namespace sigrun {

// State machine over the enum types State and Event. Transitions are
// registered per state and event, or for an event in any state.
template <class State, class Event> class FSM {
    static_assert(std::is_enum<State>::value, "State must be an enum");
    static_assert(std::is_enum<Event>::value, "Event must be an enum");

public:
    // Runs on a transition and returns the state to move to
    typedef std::function<State()> Handler;

    FSM(State initial)
        : current(initial)
    {
    }

    State state() const { return current; }

    bool is(State s) const { return current == s; }

    // Returns, if feed(event) would run a handler in the current state
    bool can(Event event) const
    {
        return any_state.count(event) || transitions.count({ current, event });
    }

    // Run fn every time the machine moves into state s
    void on(State s, std::function<void()> fn)
    {
        arrivals[s].push_back(std::move(fn));
    }

    // Register the handler of event in state from
    void act(State from, Event event, Handler fn)
    {
        transitions[{ from, event }] = std::move(fn);
    }

    // Register the handler of event in every state. Overrides handlers
    // registered with act().
    void wild_act(Event event, Handler fn) { any_state[event] = std::move(fn); }

    // Run the handler of event and move to the state it returns. Arrival
    // handlers run after the move and may feed further events. Moving to the
    // current state runs no arrival handlers.
    // Returns false, if the event has no handler in the current state.
    bool feed(Event event)
    {
        const Handler* fn = find(event);
        if (!fn) {
            return false;
        }

        const State next = (*fn)();
        if (next != current) {
            current = next;
            auto it = arrivals.find(next);
            if (it != arrivals.end()) {
                for (auto& cb : it->second) {
                    cb();
                }
            }
        }
        return true;
    }

private:
    State current;
    std::map<std::pair<State, Event>, Handler> transitions;
    std::map<Event, Handler> any_state;
    std::map<State, std::vector<std::function<void()>>> arrivals;

    const Handler* find(Event event) const
    {
        auto w = any_state.find(event);
        if (w != any_state.end()) {
            return &w->second;
        }
        auto t = transitions.find({ current, event });
        return t == transitions.end() ? nullptr : &t->second;
    }
};
}
