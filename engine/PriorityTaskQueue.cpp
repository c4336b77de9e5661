#include "PriorityTaskQueue.hpp"
#include "../common/AddressUtils.hpp"

#include <stdexcept>
#include <utility>

namespace net_scan::engine
{
    const char *ToString(ScanPriority priority)
    {
        switch (priority)
        {
        case ScanPriority::Immediate:
            return "immediate";
        case ScanPriority::High:
            return "high";
        case ScanPriority::Normal:
            return "normal";
        }
        return "normal";
    }

    ScanPriority ClassifyPriority(const std::string &address)
    {
        auto octet = common::LastOctet(address);
        if (!octet)
            return ScanPriority::Normal;

        int o = *octet;
        if (o == 1 || o == 252 || o == 253 || o == 254)
            return ScanPriority::Immediate;
        if ((o >= 2 && o <= 20) || (o >= 100 && o <= 120) || (o >= 200 && o <= 220))
            return ScanPriority::High;
        return ScanPriority::Normal;
    }

    std::uint64_t PriorityTaskQueue::Add(std::string address, std::string segment, ScanPriority priority)
    {
        ScanTask task;
        task.address = std::move(address);
        task.segment = std::move(segment);
        task.priority = priority;
        task.sequence = m_next_sequence++;

        const std::uint64_t sequence = task.sequence;
        m_heap.push_back(std::move(task));
        SiftUp(m_heap.size() - 1);
        return sequence;
    }

    void PriorityTaskQueue::Add(ScanTask task)
    {
        if (task.sequence >= m_next_sequence)
            m_next_sequence = task.sequence + 1;
        m_heap.push_back(std::move(task));
        SiftUp(m_heap.size() - 1);
    }

    ScanTask PriorityTaskQueue::RemoveFirst()
    {
        if (m_heap.empty())
            throw std::out_of_range("PriorityTaskQueue is empty");

        ScanTask first = std::move(m_heap.front());
        if (m_heap.size() > 1)
        {
            m_heap.front() = std::move(m_heap.back());
            m_heap.pop_back();
            SiftDown(0);
        }
        else
        {
            m_heap.pop_back();
        }
        return first;
    }

    std::optional<ScanTask> PriorityTaskQueue::TryRemoveFirst()
    {
        if (m_heap.empty())
            return std::nullopt;
        return RemoveFirst();
    }

    bool PriorityTaskQueue::Before(const ScanTask &a, const ScanTask &b)
    {
        if (a.priority != b.priority)
            return static_cast<int>(a.priority) < static_cast<int>(b.priority);
        return a.sequence < b.sequence;
    }

    void PriorityTaskQueue::SiftUp(std::size_t index)
    {
        while (index > 0)
        {
            std::size_t parent = (index - 1) / 2;
            if (!Before(m_heap[index], m_heap[parent]))
                break;
            std::swap(m_heap[index], m_heap[parent]);
            index = parent;
        }
    }

    void PriorityTaskQueue::SiftDown(std::size_t index)
    {
        const std::size_t size = m_heap.size();
        while (true)
        {
            std::size_t left = 2 * index + 1;
            std::size_t right = left + 1;
            std::size_t smallest = index;

            if (left < size && Before(m_heap[left], m_heap[smallest]))
                smallest = left;
            if (right < size && Before(m_heap[right], m_heap[smallest]))
                smallest = right;
            if (smallest == index)
                break;

            std::swap(m_heap[index], m_heap[smallest]);
            index = smallest;
        }
    }

    void BlockingTaskQueue::Push(const std::string &address, const std::string &segment, ScanPriority priority)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.Add(address, segment, priority);
        m_cv.notify_one();
    }

    std::optional<ScanTask> BlockingTaskQueue::Pop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]
                  { return !m_queue.Empty() || m_in_flight == 0 || m_shutdown; });

        if (m_shutdown || m_queue.Empty())
            return std::nullopt;

        ++m_in_flight;
        return m_queue.RemoveFirst();
    }

    void BlockingTaskQueue::TaskDone()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_in_flight > 0)
            --m_in_flight;
        m_cv.notify_all();
    }

    void BlockingTaskQueue::Shutdown()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        m_cv.notify_all();
    }

    std::size_t BlockingTaskQueue::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.Size();
    }

    std::size_t BlockingTaskQueue::InFlight() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_in_flight;
    }
}
