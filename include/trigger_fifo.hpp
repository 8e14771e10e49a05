#ifndef TRIGGER_FIFO_HPP
#define TRIGGER_FIFO_HPP

#include <atomic>
#include <string>
#include <thread>

namespace camrec {

class EventDispatcher;

/**
 * @file trigger_fifo.hpp
 * @brief Manual trigger channel reading JSON lines from a named pipe.
 */

/**
 * @brief Feeds newline-delimited event payloads from a FIFO to the dispatcher.
 * @threading One reader thread; start()/stop() from the owner.
 *
 * Usage: `echo '{"camera_id":"cam1","event_type":"motion"}' > /run/camrec.fifo`.
 * Each line is submitted with origin `manual` and its result is logged. A
 * line carrying a `topic` is a relayed push-monitor notification and is
 * mapped with normalizeOnvifTopic() instead.
 */
class TriggerFifo {
public:
    TriggerFifo(const std::string& path, EventDispatcher& dispatcher);
    ~TriggerFifo();

    TriggerFifo(const TriggerFifo&) = delete;
    TriggerFifo& operator=(const TriggerFifo&) = delete;

    /** @brief Create the FIFO if needed, open it and start reading. */
    bool start();
    void stop();

    /** @brief Parse and submit one line; returns false if it was rejected. */
    bool handleLine(const std::string& line);

private:
    void run();

    std::string path_;
    EventDispatcher& dispatcher_;
    int read_fd_ = -1;
    int keep_fd_ = -1; //!< Write end held open so the reader never sees EOF.
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace camrec

#endif // TRIGGER_FIFO_HPP
