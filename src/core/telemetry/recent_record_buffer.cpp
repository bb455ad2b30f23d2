// src/core/telemetry/recent_record_buffer.cpp
#include "recent_record_buffer.hpp"

namespace PacketSniffer
{
    namespace Telemetry
    {
        RecentRecordBuffer::RecentRecordBuffer(size_t capacity)
            : records_(capacity)
        {
        }

        void RecentRecordBuffer::push(const Common::PacketRecord &record)
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            records_.push(record);
        }

        std::vector<Common::PacketRecord> RecentRecordBuffer::snapshot() const
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            return records_.toVector();
        }

        std::vector<Common::PacketRecord> RecentRecordBuffer::recent(size_t n) const
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            return records_.latest(n);
        }

        size_t RecentRecordBuffer::size() const
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            return records_.size();
        }

        size_t RecentRecordBuffer::capacity() const
        {
            return records_.capacity();
        }

        void RecentRecordBuffer::clear()
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            records_.clear();
        }

    } // namespace Telemetry
} // namespace PacketSniffer
