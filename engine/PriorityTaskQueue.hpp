#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace net_scan::engine
{
    // Lower value is served first.
    enum class ScanPriority
    {
        Immediate = 0,
        High = 1,
        Normal = 2
    };

    const char *ToString(ScanPriority priority);

    // .1/.252-.254 are Immediate; .2-.20, .100-.120 and .200-.220 are High; the rest Normal.
    ScanPriority ClassifyPriority(const std::string &address);

    struct ScanTask
    {
        std::string address;
        std::string segment;
        ScanPriority priority = ScanPriority::Normal;
        std::uint64_t sequence = 0; // insertion order, FIFO tie-break
    };

    // Binary min-heap keyed on (priority, sequence).
    class PriorityTaskQueue
    {
    public:
        // Stamps the next sequence number and inserts. Returns the sequence.
        std::uint64_t Add(std::string address, std::string segment, ScanPriority priority);
        void Add(ScanTask task);

        // Throws std::out_of_range when empty.
        ScanTask RemoveFirst();
        std::optional<ScanTask> TryRemoveFirst();

        std::size_t Size() const { return m_heap.size(); }
        bool Empty() const { return m_heap.empty(); }

    private:
        static bool Before(const ScanTask &a, const ScanTask &b);
        void SiftUp(std::size_t index);
        void SiftDown(std::size_t index);

        std::vector<ScanTask> m_heap;
        std::uint64_t m_next_sequence = 0;
    };

    // Shared queue for the breadth-first workers. Pop() blocks while the queue is
    // empty but another worker still holds a task that may enqueue more; it returns
    // nullopt once the queue is drained and no task is in flight.
    class BlockingTaskQueue
    {
    public:
        void Push(const std::string &address, const std::string &segment, ScanPriority priority);

        std::optional<ScanTask> Pop();

        // Marks a task returned by Pop() as finished.
        void TaskDone();

        void Shutdown();

        std::size_t Size() const;
        std::size_t InFlight() const;

    private:
        PriorityTaskQueue m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::size_t m_in_flight = 0;
        bool m_shutdown = false;
    };
}
