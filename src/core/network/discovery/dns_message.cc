#include <array>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <cctype>
#include <core/network/discovery/dns_message.h>
#include <stdexcept>

namespace wledbackup::core::dns {

namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxNameLength = 255;
constexpr int kMaxPointerJumps = 16;

class MalformedPacket : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size)
        : data_(data)
        , size_(size) {}

    std::size_t position() const { return pos_; }
    void seek(std::size_t pos) {
        need(pos, 0);
        pos_ = pos;
    }

    std::uint8_t U8() {
        need(pos_, 1);
        return data_[pos_++];
    }

    std::uint16_t U16() {
        need(pos_, 2);
        std::uint16_t value = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return value;
    }

    std::uint32_t U32() {
        std::uint32_t high = U16();
        std::uint32_t low = U16();
        return (high << 16) | low;
    }

    template<std::size_t N>
    std::array<unsigned char, N> Bytes() {
        need(pos_, N);
        std::array<unsigned char, N> bytes{};
        for (std::size_t i = 0; i < N; ++i) {
            bytes[i] = data_[pos_ + i];
        }
        pos_ += N;
        return bytes;
    }

    // Reads a possibly compressed domain name at the cursor.
    std::string Name() {
        std::string name;
        std::size_t cursor = pos_;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            need(cursor, 1);
            std::uint8_t length = data_[cursor];
            if (length == 0) {
                ++cursor;
                break;
            }
            if ((length & 0xC0) == 0xC0) {
                need(cursor, 2);
                std::size_t offset = (static_cast<std::size_t>(length & 0x3F) << 8)
                                     | data_[cursor + 1];
                if (!jumped) {
                    pos_ = cursor + 2;
                    jumped = true;
                }
                if (++jumps > kMaxPointerJumps) {
                    throw MalformedPacket("too many compression pointers");
                }
                cursor = offset;
                continue;
            }
            if ((length & 0xC0) != 0) {
                throw MalformedPacket("unsupported label type");
            }
            ++cursor;
            need(cursor, length);
            name.append(reinterpret_cast<const char*>(data_ + cursor), length);
            name.push_back('.');
            cursor += length;
            if (name.size() > kMaxNameLength) {
                throw MalformedPacket("name too long");
            }
        }

        if (!jumped) {
            pos_ = cursor;
        }
        if (name.empty()) {
            name = ".";
        }
        return name;
    }

private:
    void need(std::size_t from, std::size_t count) const {
        if (from > size_ || count > size_ - from) {
            throw MalformedPacket("truncated packet");
        }
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
};

void appendU16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void appendName(std::vector<std::uint8_t>& out, std::string_view name) {
    while (!name.empty()) {
        auto dot = name.find('.');
        auto label = name.substr(0, dot);
        if (label.empty() || label.size() > 63) {
            throw std::invalid_argument("invalid DNS label in \"" + std::string(name) + "\"");
        }
        out.push_back(static_cast<std::uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
        if (dot == std::string_view::npos) {
            break;
        }
        name.remove_prefix(dot + 1);
    }
    out.push_back(0);
}

ResourceRecord readRecord(Reader& reader) {
    ResourceRecord record;
    record.name = reader.Name();
    record.type = reader.U16();
    record.rrclass = reader.U16() & static_cast<std::uint16_t>(~kCacheFlushBit);
    record.ttl = reader.U32();
    std::uint16_t rdlength = reader.U16();
    std::size_t rdata_start = reader.position();
    std::size_t rdata_end = rdata_start + rdlength;
    // Validates that the whole rdata is inside the packet before decoding it.
    reader.seek(rdata_end);
    reader.seek(rdata_start);

    if (record.Is(RecordType::kA)) {
        if (rdlength != 4) {
            throw MalformedPacket("bad A record length");
        }
        record.address = boost::asio::ip::address_v4(reader.Bytes<4>());
    } else if (record.Is(RecordType::kAaaa)) {
        if (rdlength != 16) {
            throw MalformedPacket("bad AAAA record length");
        }
        record.address = boost::asio::ip::address_v6(reader.Bytes<16>());
    } else if (record.Is(RecordType::kPtr)) {
        record.target = reader.Name();
    } else if (record.Is(RecordType::kSrv)) {
        record.priority = reader.U16();
        record.weight = reader.U16();
        record.port = reader.U16();
        record.target = reader.Name();
    } else if (record.Is(RecordType::kTxt)) {
        while (reader.position() < rdata_end) {
            std::uint8_t length = reader.U8();
            std::string entry;
            for (std::uint8_t i = 0; i < length; ++i) {
                entry.push_back(static_cast<char>(reader.U8()));
            }
            if (!entry.empty()) {
                record.txt.push_back(std::move(entry));
            }
        }
    }

    if (reader.position() > rdata_end) {
        throw MalformedPacket("record data overruns its length");
    }
    reader.seek(rdata_end);
    return record;
}

} // namespace

std::vector<std::uint8_t> BuildQuery(std::string_view name, RecordType type, std::uint16_t id) {
    std::vector<std::uint8_t> packet;
    packet.reserve(kHeaderSize + name.size() + 6);
    appendU16(packet, id);
    appendU16(packet, 0); // flags: standard query
    appendU16(packet, 1); // qdcount
    appendU16(packet, 0);
    appendU16(packet, 0);
    appendU16(packet, 0);
    if (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    appendName(packet, name);
    appendU16(packet, static_cast<std::uint16_t>(type));
    appendU16(packet, kClassIn);
    return packet;
}

std::optional<Message> ParseMessage(const std::uint8_t* data, std::size_t size) {
    try {
        Reader reader(data, size);
        Message message;
        message.id = reader.U16();
        message.flags = reader.U16();
        std::uint16_t qdcount = reader.U16();
        std::uint16_t ancount = reader.U16();
        std::uint16_t nscount = reader.U16();
        std::uint16_t arcount = reader.U16();

        for (std::uint16_t i = 0; i < qdcount; ++i) {
            Question question;
            question.name = reader.Name();
            question.type = reader.U16();
            question.rrclass = reader.U16();
            message.questions.push_back(std::move(question));
        }

        std::size_t record_count = static_cast<std::size_t>(ancount) + nscount + arcount;
        for (std::size_t i = 0; i < record_count; ++i) {
            message.records.push_back(readRecord(reader));
        }
        return message;
    } catch (const MalformedPacket&) {
        return std::nullopt;
    }
}

std::string CanonicalName(std::string_view name) {
    std::string canonical;
    canonical.reserve(name.size() + 1);
    for (char c : name) {
        canonical.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (canonical.empty() || canonical.back() != '.') {
        canonical.push_back('.');
    }
    return canonical;
}

} // namespace wledbackup::core::dns
