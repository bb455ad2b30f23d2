// src/core/telemetry/recent_record_buffer.hpp
#ifndef PACKET_SNIFFER_RECENT_RECORD_BUFFER_HPP
#define PACKET_SNIFFER_RECENT_RECORD_BUFFER_HPP

#include "../../common/packet_record.hpp"
#include "ring_buffer.hpp"
#include <mutex>
#include <vector>

namespace PacketSniffer
{
    namespace Telemetry
    {
        /**
         * @brief Buffer thread-safe chứa N record gần nhất (mặc định 1000)
         */
        class RecentRecordBuffer
        {
        public:
            explicit RecentRecordBuffer(size_t capacity = 1000);

            void push(const Common::PacketRecord &record);

            /**
             * @brief Copy toàn bộ record theo thứ tự chèn (cũ nhất trước)
             */
            std::vector<Common::PacketRecord> snapshot() const;

            /**
             * @brief n record mới nhất, theo thứ tự chèn
             */
            std::vector<Common::PacketRecord> recent(size_t n) const;

            size_t size() const;
            size_t capacity() const;
            void clear();

        private:
            mutable std::mutex buffer_mutex_;
            RingBuffer<Common::PacketRecord> records_;
        };

    } // namespace Telemetry
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_RECENT_RECORD_BUFFER_HPP
