#include "utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::vector<unsigned char> sha1_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA_DIGEST_LENGTH);
    SHA1((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string base64_encode(const std::vector<unsigned char>& data){
    if(data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

namespace {

std::string format_uuid(const std::vector<unsigned char>& bytes){
    auto hex = hex_from_bytes(std::vector<unsigned char>(bytes.begin(), bytes.begin() + 16));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::optional<std::vector<unsigned char>> parse_uuid(const std::string& text){
    if(!is_uuid(text)) return std::nullopt;
    std::string hex;
    for(char c : text) if(c != '-') hex.push_back(c);
    std::vector<unsigned char> out;
    out.reserve(16);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        out.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

} // namespace

std::string uuid_v4(){
    auto bytes = random_bytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
    return format_uuid(bytes);
}

std::string uuid_v5(const std::string& namespace_uuid, const std::string& name){
    auto ns = parse_uuid(namespace_uuid);
    if(!ns) throw std::invalid_argument("invalid namespace uuid: " + namespace_uuid);
    std::string input(ns->begin(), ns->end());
    input += name;
    auto digest = sha1_bytes(input);
    digest[6] = static_cast<unsigned char>((digest[6] & 0x0f) | 0x50);
    digest[8] = static_cast<unsigned char>((digest[8] & 0x3f) | 0x80);
    return format_uuid(digest);
}

bool is_uuid(const std::string& value){
    if(value.size() != 36) return false;
    for(std::size_t i = 0; i < value.size(); ++i){
        if(i == 8 || i == 13 || i == 18 || i == 23){
            if(value[i] != '-') return false;
        } else if(!std::isxdigit(static_cast<unsigned char>(value[i]))){
            return false;
        }
    }
    return true;
}

std::string format_timestamp(SystemTime tp){
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    auto millis = duration_cast<milliseconds>(tp - secs).count();
    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis));
    return out;
}

std::optional<SystemTime> parse_timestamp(const std::string& text){
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if(in.fail()) return std::nullopt;

    std::chrono::milliseconds fraction{0};
    if(in.peek() == '.'){
        in.get();
        std::string digits;
        while(std::isdigit(in.peek())) digits.push_back(static_cast<char>(in.get()));
        digits = (digits + "000").substr(0, 3);
        fraction = std::chrono::milliseconds(std::stoi(digits));
    }

    long offset_seconds = 0;
    int next = in.peek();
    if(next == 'Z' || next == 'z'){
        in.get();
    } else if(next == '+' || next == '-'){
        char sign = static_cast<char>(in.get());
        int hh = 0, mm = 0;
        char colon = 0;
        in >> hh >> colon >> mm;
        if(in.fail()) return std::nullopt;
        offset_seconds = (hh * 3600L + mm * 60L) * (sign == '-' ? -1 : 1);
    }

    std::time_t t = timegm(&tm);
    if(t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t - offset_seconds) + fraction;
}

std::string to_valid_utf8(const std::string& text){
    static const char replacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(text.size());
    const auto* bytes = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t size = text.size();
    std::size_t i = 0;
    while(i < size){
        unsigned char lead = bytes[i];
        std::size_t length = 0;
        unsigned char low = 0x80, high = 0xBF;
        if(lead < 0x80) length = 1;
        else if(lead >= 0xC2 && lead <= 0xDF) length = 2;
        else if(lead >= 0xE0 && lead <= 0xEF){
            length = 3;
            if(lead == 0xE0) low = 0xA0;
            if(lead == 0xED) high = 0x9F;
        }
        else if(lead >= 0xF0 && lead <= 0xF4){
            length = 4;
            if(lead == 0xF0) low = 0x90;
            if(lead == 0xF4) high = 0x8F;
        }
        bool valid = length > 0 && i + length <= size;
        for(std::size_t k = 1; valid && k < length; ++k){
            unsigned char c = bytes[i + k];
            unsigned char lo = k == 1 ? low : 0x80;
            unsigned char hi = k == 1 ? high : 0xBF;
            if(c < lo || c > hi) valid = false;
        }
        if(valid){
            out.append(text, i, length);
            i += length;
        } else {
            out.append(replacement);
            ++i;
        }
    }
    return out;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string to_upper(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

bool iequals(const std::string& a, const std::string& b){
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

std::string local_hostname(){
    char hostname[256];
    if(gethostname(hostname, sizeof(hostname)) != 0) {
        return "specsync-machine";
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return hostname;
}
