#ifndef GIFSEQ_PROGRESS_H
#define GIFSEQ_PROGRESS_H

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace GIFSeq {

enum class Stage : uint32_t {
    Sampling,
    Quantizing,
    Writing,
    Done,
};

const char*
stageName(Stage stage) noexcept;

struct ProgressEvent {
    Stage stage = Stage::Sampling;
    std::string currentItemName;
    uint32_t processedCount = 0;
    uint32_t totalCount     = 0;
    std::optional<std::string> finalOutputPath;  // only set on the terminal event
    std::vector<std::string> processedFiles;     // terminal event only, in input order

    [[nodiscard]] bool
    isFinal() const noexcept {
        return stage == Stage::Done;
    }
};

/**
 * @brief Bounded multi-producer, single-consumer event queue.
 *
 * publish() never waits for the consumer. When the buffer is full the
 * oldest non-terminal event is discarded to make room.
 */
class ProgressChannel {
  public:
    static constexpr size_t DEFAULT_CAPACITY = 64;

    explicit ProgressChannel(size_t capacity = DEFAULT_CAPACITY);

    ProgressChannel(const ProgressChannel&)            = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    // ignored after close()
    void
    publish(ProgressEvent event);

    /**
     * @brief Block until an event is available.
     * @return std::nullopt once the channel is closed and drained
     */
    std::optional<ProgressEvent>
    receive();

    void
    close() noexcept;

    [[nodiscard]] bool
    isClosed() const noexcept;

    [[nodiscard]] size_t
    getDroppedCount() const noexcept;

  private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_dataAvailable;
    std::deque<ProgressEvent> m_buffer;
    size_t m_dropped = 0;
    bool m_closed    = false;
};

/**
 * @return @p path itself if short enough, otherwise "..." followed by its tail
 */
std::string
shortenPath(const std::string& path, size_t maxLength = 50);

std::string
renderProgressBar(const ProgressEvent& event, size_t width = 30);

/**
 * @brief Draws events from a channel on a console stream, on its own thread.
 */
class ConsolePresenter {
  public:
    ConsolePresenter(ProgressChannel& channel, std::ostream& out, bool debug) noexcept;

    ~ConsolePresenter();

    ConsolePresenter(const ConsolePresenter&)            = delete;
    ConsolePresenter& operator=(const ConsolePresenter&) = delete;

    void
    start();

    /**
     * @brief Wait until the terminal event was drawn or the channel closed.
     * @return true if the terminal event was seen
     */
    bool
    wait();

    // files listed by the terminal event
    [[nodiscard]] const std::vector<std::string>&
    getProcessedFiles() const noexcept {
        return m_processedFiles;
    }

  private:
    void
    run();

    void
    draw(const ProgressEvent& event);

    void
    summarize(const ProgressEvent& event);

    ProgressChannel& m_channel;
    std::ostream& m_out;
    const bool m_debug;
    std::thread m_thread;
    std::vector<std::string> m_processedFiles;
    std::optional<Stage> m_lastStage;
    bool m_sawFinal = false;
};

}  // namespace GIFSeq

#endif  // GIFSEQ_PROGRESS_H
