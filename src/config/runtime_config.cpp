#include "factoreval/config/runtime_config.h"
#include "factoreval/config/config_utils.h"
#include "factoreval/core/errors.h"
#include <fstream>
#include <sstream>
#include <cctype>
#include <stdexcept>

namespace factoreval::config {

static void parse_ini(std::istream& in, std::unordered_map<std::string,std::string>& out) {
    std::string line, sect;
    while (std::getline(in, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0]=='#' || line[0]==';') continue;
        if (line.front()=='[' && line.back()==']') { sect = trim_copy(line.substr(1, line.size()-2)); continue; }
        auto pos = line.find('=');
        if (pos==std::string::npos) continue;
        std::string k = trim_copy(line.substr(0,pos));
        std::string v = trim_copy(line.substr(pos+1));
        std::string full = sect.empty()? k : (sect + "." + k);
        out[full] = v;
    }
}

IniConfig IniConfig::from_file(const std::string& path) {
    std::ifstream fin(path);
    if (!fin.good()) {
        throw ConfigurationError("无法打开配置文件: " + path);
    }
    return from_stream(fin);
}

IniConfig IniConfig::from_stream(std::istream& in) {
    IniConfig cfg;
    parse_ini(in, cfg.kv_);
    return cfg;
}

bool IniConfig::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string IniConfig::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    return (it==kv_.end()) ? def : it->second;
}

namespace {

// std::sto* 只要前缀合法就会成功，这里要求整串都被消费
template <typename Fn>
auto parse_whole(const std::string& key, const std::string& raw, Fn&& fn) -> decltype(fn(raw, nullptr)) {
    std::size_t consumed = 0;
    try {
        auto v = fn(raw, &consumed);
        if (consumed != raw.size()) {
            throw ConfigurationError("配置项 " + key + " 不是合法数值: " + raw);
        }
        return v;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError("配置项 " + key + " 不是合法数值: " + raw);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("配置项 " + key + " 超出取值范围: " + raw);
    }
}

} // namespace

int IniConfig::geti(const std::string& key, int def) const {
    auto it = kv_.find(key); if (it==kv_.end()) return def;
    return parse_whole(key, it->second, [](const std::string& s, std::size_t* p) { return std::stoi(s, p); });
}
double IniConfig::getd(const std::string& key, double def) const {
    auto it = kv_.find(key); if (it==kv_.end()) return def;
    return parse_whole(key, it->second, [](const std::string& s, std::size_t* p) { return std::stod(s, p); });
}
bool IniConfig::getb(const std::string& key, bool def) const {
    auto it=kv_.find(key); if (it==kv_.end()) return def;
    std::string v = it->second; for (auto& c: v) c = (char)std::tolower((unsigned char)c);
    if (v=="1"||v=="true"||v=="yes"||v=="on") return true;
    if (v=="0"||v=="false"||v=="no"||v=="off") return false;
    throw ConfigurationError("配置项 " + key + " 不是合法布尔值: " + it->second);
}

} // namespace factoreval::config
