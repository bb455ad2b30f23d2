// src/core/telemetry/ring_buffer.hpp
#ifndef PACKET_SNIFFER_RING_BUFFER_HPP
#define PACKET_SNIFFER_RING_BUFFER_HPP

#include <deque>
#include <vector>
#include <cstddef>

namespace PacketSniffer
{
    namespace Telemetry
    {
        /**
         * @brief Buffer FIFO có giới hạn, phần tử cũ nhất bị loại khi đầy
         *
         * Không thread-safe, người sở hữu tự lock.
         */
        template <typename T>
        class RingBuffer
        {
        public:
            explicit RingBuffer(size_t capacity) : capacity_(capacity) {}

            void push(const T &value)
            {
                if (capacity_ == 0)
                    return;

                items_.push_back(value);
                while (items_.size() > capacity_)
                {
                    items_.pop_front();
                }
            }

            /**
             * @brief Copy theo thứ tự chèn (cũ nhất trước)
             */
            std::vector<T> toVector() const
            {
                return std::vector<T>(items_.begin(), items_.end());
            }

            /**
             * @brief n phần tử mới nhất, vẫn theo thứ tự chèn
             */
            std::vector<T> latest(size_t n) const
            {
                size_t count = n < items_.size() ? n : items_.size();
                return std::vector<T>(items_.end() - count, items_.end());
            }

            size_t size() const { return items_.size(); }
            size_t capacity() const { return capacity_; }
            bool empty() const { return items_.empty(); }
            void clear() { items_.clear(); }

        private:
            size_t capacity_;
            std::deque<T> items_;
        };

    } // namespace Telemetry
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_RING_BUFFER_HPP
