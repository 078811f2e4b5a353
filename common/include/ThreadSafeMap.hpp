#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная hash-map со значениями по shared_ptr
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения хранятся как std::shared_ptr<const V>: читатель получает
 * неизменяемый снимок, запись всегда заменяет указатель целиком.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    using ValuePtr = std::shared_ptr<const V>;

    ThreadSafeMap() = default;

    void insert(const K &key, ValuePtr value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = std::move(value);
    }

    /**
     * @brief Атомарно вставить значение, если ключа ещё нет
     * @return true если вставлено, false если ключ уже занят
     */
    bool insertIfAbsent(const K &key, ValuePtr value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, std::move(value)).second;
    }

    ValuePtr find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    bool remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Снимок всех значений на момент вызова
     */
    std::vector<ValuePtr> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<ValuePtr> result;
        result.reserve(map_.size());
        for (const auto &entry : map_)
        {
            result.push_back(entry.second);
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, ValuePtr> map_;
};
