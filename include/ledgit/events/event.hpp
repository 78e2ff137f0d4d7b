#pragma once

#include <datapod/datapod.hpp>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ledgit {

    /// Event types emitted by the registries
    enum class EventType : dp::u8 {
        OwnershipTransferred = 0,
        BlockCreated = 1,
        BlockEvolved = 2,
        BlocksMerged = 3,
        FeesWithdrawn = 4,
        ContentCreated = 5,
        VersionCreated = 6,
        VersionStatusChanged = 7,
        Transfer = 8,
        Approval = 9,
    };

    /// Get string name for event type
    inline std::string eventTypeToString(EventType type) {
        switch (type) {
        case EventType::OwnershipTransferred:
            return "OwnershipTransferred";
        case EventType::BlockCreated:
            return "BlockCreated";
        case EventType::BlockEvolved:
            return "BlockEvolved";
        case EventType::BlocksMerged:
            return "BlocksMerged";
        case EventType::FeesWithdrawn:
            return "FeesWithdrawn";
        case EventType::ContentCreated:
            return "ContentCreated";
        case EventType::VersionCreated:
            return "VersionCreated";
        case EventType::VersionStatusChanged:
            return "VersionStatusChanged";
        case EventType::Transfer:
            return "Transfer";
        case EventType::Approval:
            return "Approval";
        default:
            return "Unknown";
        }
    }

    struct EventField {
        dp::String name;
        dp::String value;

        auto members() { return std::tie(name, value); }
        auto members() const { return std::tie(name, value); }
    };

    /// Escape text for use inside a JSON string literal
    inline std::string escapeJson(const std::string &text) {
        std::ostringstream oss;
        for (unsigned char c : text) {
            switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (c < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << static_cast<char>(c);
                }
            }
        }
        return oss.str();
    }

    /// Structured notification of a state change
    struct Event {
        dp::u8 type{0};           // EventType
        dp::String contract;      // Emitting registry name
        dp::i64 timestamp{0};     // Host timestamp of the call
        dp::Vector<EventField> fields;

        Event() = default;

        Event(EventType t, const std::string &contract_name, dp::i64 ts)
            : type(static_cast<dp::u8>(t)), contract(dp::String(contract_name.c_str())), timestamp(ts) {}

        inline EventType getType() const { return static_cast<EventType>(type); }

        inline std::string getContract() const { return std::string(contract.c_str()); }

        inline Event &with(const std::string &name, const std::string &value) {
            fields.push_back(EventField{dp::String(name.c_str()), dp::String(value.c_str())});
            return *this;
        }

        inline Event &withNumber(const std::string &name, dp::u64 value) { return with(name, std::to_string(value)); }

        inline Event &withFlag(const std::string &name, bool value) {
            return with(name, std::string(value ? "true" : "false"));
        }

        /// Field value by name, empty if absent
        inline std::string get(const std::string &name) const {
            for (const auto &f : fields) {
                if (std::string(f.name.c_str()) == name) {
                    return std::string(f.value.c_str());
                }
            }
            return "";
        }

        inline bool has(const std::string &name) const {
            for (const auto &f : fields) {
                if (std::string(f.name.c_str()) == name) {
                    return true;
                }
            }
            return false;
        }

        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"event\":\"" << eventTypeToString(getType()) << "\",\"contract\":\""
                << escapeJson(getContract()) << "\",\"timestamp\":" << timestamp;
            for (const auto &f : fields) {
                oss << ",\"" << escapeJson(f.name.c_str()) << "\":\"" << escapeJson(f.value.c_str()) << "\"";
            }
            oss << "}";
            return oss.str();
        }

        auto members() { return std::tie(type, contract, timestamp, fields); }
        auto members() const { return std::tie(type, contract, timestamp, fields); }
    };

} // namespace ledgit
