#pragma once

#include "gambler/EventBus.hpp"
#include "gambler/Engine.hpp"
#include "gambler/JsonCodec.hpp"
#include "gambler/RunStore.hpp"
#include <memory>
#include <string>
#include <vector>
#include <iostream>

namespace gambler {

/**
 * RunRecorder
 *
 * Write path for a backtest run: subscribes to the run topics on the bus and
 * hands everything it sees to a RunStore.
 *
 * - RunStart    -> runs row (with the run configuration)
 * - BarAccepted -> bars table (buffered); bars the engine dropped are skipped
 * - OrderStatus -> events table (buffered)
 * - RunEnd      -> flush, then the summary on the runs row
 *
 * Storage errors are logged and do not stop the run.
 */
class RunRecorder {
public:
    /**
     * @param bus Bus of the engine being recorded
     * @param store Store to write into
     * @param config Run configuration saved alongside the run
     */
    RunRecorder(EventBus& bus, std::shared_ptr<RunStore> store, json config = json::object())
        : bus_(bus), store_(std::move(store)), config_(std::move(config)) {}

    ~RunRecorder() {
        stop();
    }

    RunRecorder(const RunRecorder&) = delete;
    RunRecorder& operator=(const RunRecorder&) = delete;

    void start() {
        if (running_) return;
        running_ = true;

        subs_.emplace_back(topics::kRunStart, bus_.subscribe(topics::kRunStart, [this](const Event& ev) {
            try {
                on_run_start(std::any_cast<RunInfo>(ev.data));
            } catch (const std::exception& e) {
                std::cerr << "[RunRecorder] Failed to record RunStart: " << e.what() << "\n";
            }
        }));

        subs_.emplace_back(topics::kBarAccepted, bus_.subscribe(topics::kBarAccepted, [this](const Event& ev) {
            try {
                const auto& bar = std::any_cast<const Bar&>(ev.data);
                if (!run_id_.empty()) store_->add_bar(run_id_, bar);
            } catch (const std::exception& e) {
                std::cerr << "[RunRecorder] Failed to record Bar: " << e.what() << "\n";
            }
        }));

        subs_.emplace_back(topics::kOrderStatus, bus_.subscribe(topics::kOrderStatus, [this](const Event& ev) {
            try {
                const auto& status = std::any_cast<const OrderStatusEvent&>(ev.data);
                if (!run_id_.empty()) {
                    store_->add_event(run_id_, topics::kOrderStatus, to_epoch_ms(status.timestamp),
                                      status.symbol, json(status));
                }
            } catch (const std::exception& e) {
                std::cerr << "[RunRecorder] Failed to record OrderStatus: " << e.what() << "\n";
            }
        }));

        subs_.emplace_back(topics::kRunEnd, bus_.subscribe(topics::kRunEnd, [this](const Event& ev) {
            try {
                on_run_end(std::any_cast<RunStats>(ev.data));
            } catch (const std::exception& e) {
                std::cerr << "[RunRecorder] Failed to record RunEnd: " << e.what() << "\n";
            }
        }));
    }

    /**
     * Unsubscribe and flush whatever is still buffered.
     */
    void stop() {
        if (!running_) return;
        running_ = false;

        for (const auto& [topic, id] : subs_) {
            bus_.unsubscribe(topic, id);
        }
        subs_.clear();

        try {
            store_->flush_all();
        } catch (const std::exception& e) {
            std::cerr << "[RunRecorder] Final flush failed: " << e.what() << "\n";
        }
    }

    const std::string& run_id() const { return run_id_; }

private:
    EventBus& bus_;
    std::shared_ptr<RunStore> store_;
    json config_;
    std::string run_id_;
    bool running_{false};
    std::vector<std::pair<std::string, EventBus::HandlerId>> subs_;

    void on_run_start(const RunInfo& info) {
        store_->begin_run(info.run_id, info.symbol, config_);
        run_id_ = info.run_id;
    }

    void on_run_end(const RunStats& stats) {
        if (run_id_.empty()) return;
        store_->finish_run(run_id_, json(stats));
        std::cout << "[RunRecorder] Saved run " << run_id_ << " (" << stats.bars << " bars)\n";
    }
};

} // namespace gambler
