// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <Print.h>
#include <TaskSchedulerDeclarations.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <mutex>
#include <unordered_map>
#include <vector>

// collects output per FreeRTOS task and writes complete lines only, such
// that lines printed by concurrently running tasks do not interleave.
class MessageOutputClass : public Print {
public:
    MessageOutputClass();
    void init(Scheduler& scheduler);
    size_t write(uint8_t c) override;
    size_t write(const uint8_t* buffer, size_t size) override;

private:
    void loop();

    Task _loopTask;

    using message_t = std::vector<uint8_t>;

    static void serialWrite(message_t const& m);

    std::unordered_map<TaskHandle_t, message_t> _task_messages;
    std::mutex _msgLock;
};

extern MessageOutputClass MessageOutput;
