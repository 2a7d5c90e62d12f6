#pragma once
#include <istream>
#include <string>
#include <unordered_map>

namespace factoreval::config {

    /**
     * @brief INI 键值表："[section] key = value" 展平为 "section.key"。
     *
     * 不再是进程单例：每次评估由调用方显式加载并传入，
     * 同一进程里可以同时存在多份不同的配置。
     */
    class IniConfig {
    public:
        IniConfig() = default;

        // 从文件加载；文件不存在或无法打开抛 ConfigurationError
        static IniConfig from_file(const std::string& path);
        // 从任意输入流加载（测试里直接喂 std::istringstream）
        static IniConfig from_stream(std::istream& in);

        bool has(const std::string& key) const;

        // 读取字符串或带默认值的类型化访问；值无法解析时抛 ConfigurationError
        std::string get(const std::string& key, const std::string& def) const;
        int     geti (const std::string& key, int def) const;
        double  getd (const std::string& key, double def) const;
        bool    getb (const std::string& key, bool def) const;

        void set(const std::string& key, const std::string& value) { kv_[key] = value; }

    private:
        std::unordered_map<std::string, std::string> kv_; // "section.key" -> value
    };

} // namespace factoreval::config
