// SPDX-License-Identifier: GPL-2.0-or-later
#include <HardwareSerial.h>
#include "MessageOutput.h"

MessageOutputClass MessageOutput;

MessageOutputClass::MessageOutputClass()
    : _loopTask(TASK_SECOND, TASK_FOREVER, std::bind(&MessageOutputClass::loop, this))
{
}

void MessageOutputClass::init(Scheduler& scheduler)
{
    scheduler.addTask(_loopTask);
    _loopTask.enable();
}

void MessageOutputClass::serialWrite(MessageOutputClass::message_t const& m)
{
    // skip writing if the console is not attached
    if (!Serial) { return; }

    size_t written = 0;
    while (written < m.size()) {
        written += Serial.write(m.data() + written, m.size() - written);
    }

    Serial.flush();
}

size_t MessageOutputClass::write(uint8_t c)
{
    return write(&c, 1);
}

size_t MessageOutputClass::write(const uint8_t* buffer, size_t size)
{
    std::lock_guard<std::mutex> lock(_msgLock);

    auto res = _task_messages.emplace(xTaskGetCurrentTaskHandle(), message_t());
    auto iter = res.first;
    auto& message = iter->second;

    message.reserve(message.size() + size);

    for (size_t idx = 0; idx < size; ++idx) {
        uint8_t c = buffer[idx];

        message.push_back(c);

        if (c == '\n') {
            serialWrite(message);
            message.clear();
        }
    }

    if (message.empty()) { _task_messages.erase(iter); }

    return size;
}

void MessageOutputClass::loop()
{
    std::lock_guard<std::mutex> lock(_msgLock);

    // drop partial lines of tasks which were deleted in the meantime,
    // e.g., a gateway's polling task after it was reconfigured.
    auto iter = _task_messages.begin();
    while (iter != _task_messages.end()) {
        if (eTaskGetState(iter->first) == eDeleted) {
            iter = _task_messages.erase(iter);
            continue;
        }

        ++iter;
    }
}
