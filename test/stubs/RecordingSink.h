#pragma once

#include <set>
#include <utility>
#include <vector>
#include <envoy/Sink.h>

// declares the core channels only, unless told otherwise
struct RecordingSink : public Envoy::Sink {
    using channel_t = std::pair<Envoy::Component, Envoy::Attribute>;

    std::set<channel_t> Optional;
    std::set<channel_t> Rejecting;
    std::vector<Envoy::Event> Events;
    bool Available = true;

    bool supports(Envoy::Component target, Envoy::Attribute kind) const override {
        switch (kind) {
            case Envoy::Attribute::Power:
            case Envoy::Attribute::Energy:
            case Envoy::Attribute::Exporting:
                return true;
            default:
                return Optional.count({ target, kind }) > 0;
        }
    }

    bool isAvailable() const override { return Available; }

    bool emit(Envoy::Event const& event) override {
        if (Rejecting.count({ event.Target, event.Kind }) > 0) { return false; }
        Events.push_back(event);
        return true;
    }

    Envoy::Event const* find(Envoy::Component target, Envoy::Attribute kind) const {
        for (auto const& e : Events) {
            if (e.Target == target && e.Kind == kind) { return &e; }
        }
        return nullptr;
    }

    double number(Envoy::Component target, Envoy::Attribute kind) const {
        return std::get<double>(find(target, kind)->Value);
    }
};
