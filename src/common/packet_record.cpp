// src/common/packet_record.cpp
#include "packet_record.hpp"

namespace PacketSniffer
{
    namespace Common
    {
        const char *threatLevelToString(ThreatLevel level)
        {
            switch (level)
            {
            case ThreatLevel::Safe:
                return "Safe";
            case ThreatLevel::Low:
                return "Low";
            case ThreatLevel::Medium:
                return "Medium";
            case ThreatLevel::High:
                return "High";
            case ThreatLevel::Critical:
                return "Critical";
            }
            return "Safe";
        }

    } // namespace Common
} // namespace PacketSniffer
