#include "progress.h"

#include <algorithm>
#include <iomanip>
#include <utility>

using namespace GIFSeq;
using std::string;

const char*
GIFSeq::stageName(const Stage stage) noexcept {
    switch (stage) {
        case Stage::Sampling:
            return "Sampling";
        case Stage::Quantizing:
            return "Quantizing";
        case Stage::Writing:
            return "Writing";
        case Stage::Done:
            return "Done";
    }
    return "Unknown";
}

ProgressChannel::ProgressChannel(const size_t capacity)
    : m_capacity(std::max<size_t>(capacity, 1)) {}

void
ProgressChannel::publish(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        if (m_buffer.size() >= m_capacity) {
            const auto victim = std::find_if(m_buffer.begin(), m_buffer.end(), [](const ProgressEvent& e) {
                return !e.isFinal();
            });
            if (victim != m_buffer.end()) {
                m_buffer.erase(victim);
                ++m_dropped;
            } else if (!event.isFinal()) {
                ++m_dropped;
                return;
            }
        }
        m_buffer.push_back(std::move(event));
    }
    m_dataAvailable.notify_one();
}

std::optional<ProgressEvent>
ProgressChannel::receive() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_dataAvailable.wait(lock, [this]() { return !m_buffer.empty() || m_closed; });
    if (m_buffer.empty()) {
        return std::nullopt;
    }
    auto event = std::move(m_buffer.front());
    m_buffer.pop_front();
    return event;
}

void
ProgressChannel::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_dataAvailable.notify_all();
}

bool
ProgressChannel::isClosed() const noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t
ProgressChannel::getDroppedCount() const noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

string
GIFSeq::shortenPath(const string& path, const size_t maxLength) {
    if (path.size() <= maxLength || maxLength <= 3) {
        return path;
    }
    return "..." + path.substr(path.size() - (maxLength - 3));
}

string
GIFSeq::renderProgressBar(const ProgressEvent& event, const size_t width) {
    const size_t filled = event.totalCount == 0
                              ? width
                              : std::min(width, width * event.processedCount / event.totalCount);
    return "[" + string(filled, '#') + string(width - filled, '-') + "]";
}

ConsolePresenter::ConsolePresenter(ProgressChannel& channel, std::ostream& out, const bool debug) noexcept
    : m_channel(channel),
      m_out(out),
      m_debug(debug) {}

ConsolePresenter::~ConsolePresenter() {
    if (m_thread.joinable()) {
        m_channel.close();
        m_thread.join();
    }
}

void
ConsolePresenter::start() {
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::thread(&ConsolePresenter::run, this);
}

bool
ConsolePresenter::wait() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
    return m_sawFinal;
}

void
ConsolePresenter::run() {
    while (const auto event = m_channel.receive()) {
        if (event->isFinal()) {
            if (m_lastStage && !m_debug) {
                m_out << "\n";
            }
            summarize(*event);
            m_sawFinal = true;
            return;
        }
        draw(*event);
    }
    // closed without a terminal event
    if (m_lastStage && !m_debug) {
        m_out << "\n";
    }
    m_out.flush();
}

void
ConsolePresenter::draw(const ProgressEvent& event) {
    if (m_debug) {
        m_out << "[" << stageName(event.stage) << "] " << event.processedCount << "/" << event.totalCount << " "
              << event.currentItemName << "\n";
        m_lastStage = event.stage;
        return;
    }
    if (m_lastStage && *m_lastStage != event.stage) {
        m_out << "\n";
    }
    m_lastStage = event.stage;
    // completed count includes the item being reported on
    ProgressEvent shown = event;
    if (event.stage != Stage::Writing) {
        shown.processedCount = std::min(event.processedCount + 1, event.totalCount);
    }
    m_out << "\r" << std::left << std::setw(10) << stageName(event.stage) << " " << renderProgressBar(shown) << " "
          << shown.processedCount << "/" << shown.totalCount << " " << shortenPath(event.currentItemName)
          << "\033[K" << std::flush;
}

void
ConsolePresenter::summarize(const ProgressEvent& event) {
    m_processedFiles = event.processedFiles;
    m_out << "Done! Processed " << event.totalCount << " files.\n";
    if (event.finalOutputPath) {
        m_out << "GIF file generated at: " << *event.finalOutputPath << "\n";
    }
    if (m_debug && !m_processedFiles.empty()) {
        const auto indexWidth = std::to_string(m_processedFiles.size()).size();
        m_out << "Processed files:\n";
        for (size_t i = 0; i < m_processedFiles.size(); ++i) {
            m_out << "  " << std::right << std::setw(static_cast<int>(indexWidth)) << (i + 1) << ". "
                  << shortenPath(m_processedFiles[i]) << "\n";
        }
    }
    m_out.flush();
}
