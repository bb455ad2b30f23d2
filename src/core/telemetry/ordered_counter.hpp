// src/core/telemetry/ordered_counter.hpp
#ifndef PACKET_SNIFFER_ORDERED_COUNTER_HPP
#define PACKET_SNIFFER_ORDERED_COUNTER_HPP

#include <unordered_map>
#include <vector>
#include <utility>
#include <cstdint>
#include <cstddef>

namespace PacketSniffer
{
    namespace Telemetry
    {
        /**
         * @brief Bảng đếm giữ thứ tự xuất hiện lần đầu của key
         *
         * Khi sắp xếp ổn định theo count, các key bằng nhau giữ nguyên thứ tự
         * xuất hiện, nên bảng xếp hạng luôn xác định.
         */
        template <typename Key, typename Hash = std::hash<Key>>
        class OrderedCounter
        {
        public:
            using Entry = std::pair<Key, uint64_t>;

            void increment(const Key &key, uint64_t by = 1)
            {
                auto it = index_.find(key);
                if (it == index_.end())
                {
                    index_.emplace(key, entries_.size());
                    entries_.emplace_back(key, by);
                    return;
                }
                entries_[it->second].second += by;
            }

            uint64_t get(const Key &key) const
            {
                auto it = index_.find(key);
                return it != index_.end() ? entries_[it->second].second : 0;
            }

            const std::vector<Entry> &entries() const { return entries_; }
            size_t size() const { return entries_.size(); }
            bool empty() const { return entries_.empty(); }

        private:
            std::vector<Entry> entries_;
            std::unordered_map<Key, size_t, Hash> index_;
        };

    } // namespace Telemetry
} // namespace PacketSniffer

#endif // PACKET_SNIFFER_ORDERED_COUNTER_HPP
