#ifndef CAMSYNC_CASE_INSENSITIVE_MAP_H
#define CAMSYNC_CASE_INSENSITIVE_MAP_H

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <utility>
#include <algorithm>
#include <cctype>

namespace CamSync {

/**
 * Map keyed by string, compared case-insensitively.
 *
 * Keys are normalized to lowercase for lookup; the spelling used by the
 * most recent insert is kept for display. Iteration is ordered by the
 * normalized key.
 */
template<typename T>
class CaseInsensitiveMap {
public:
    struct Entry {
        std::string key;   // original spelling
        T value;
    };

    using Storage = std::map<std::string, Entry>;
    using const_iterator = typename Storage::const_iterator;

    static std::string normalize(const std::string& key) {
        std::string lower = key;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    /**
     * Insert or overwrite. Returns true if the key was new.
     */
    bool set(const std::string& key, T value) {
        auto result = m_entries.insert_or_assign(normalize(key), Entry{key, std::move(value)});
        return result.second;
    }

    bool contains(const std::string& key) const {
        return m_entries.find(normalize(key)) != m_entries.end();
    }

    const T* find(const std::string& key) const {
        auto it = m_entries.find(normalize(key));
        return it == m_entries.end() ? nullptr : &it->second.value;
    }

    T* find(const std::string& key) {
        auto it = m_entries.find(normalize(key));
        return it == m_entries.end() ? nullptr : &it->second.value;
    }

    /**
     * Original spelling stored for a key, if present
     */
    std::optional<std::string> displayKey(const std::string& key) const {
        auto it = m_entries.find(normalize(key));
        if (it == m_entries.end()) return std::nullopt;
        return it->second.key;
    }

    bool erase(const std::string& key) {
        return m_entries.erase(normalize(key)) > 0;
    }

    void clear() { m_entries.clear(); }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    std::vector<std::string> keys() const {
        std::vector<std::string> result;
        result.reserve(m_entries.size());
        for (const auto& item : m_entries) {
            result.push_back(item.second.key);
        }
        return result;
    }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

private:
    Storage m_entries;
};

} // namespace CamSync

#endif // CAMSYNC_CASE_INSENSITIVE_MAP_H
