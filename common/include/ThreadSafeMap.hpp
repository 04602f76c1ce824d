#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <utility>

/**
 * @brief Потокобезопасная карта со снимками значений
 *
 * Значения хранятся как std::shared_ptr и никогда не меняются на месте:
 * запись всегда подменяет указатель целиком, поэтому читатель под
 * shared_lock получает согласованный объект.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    /**
     * @brief Вставить, только если ключа ещё нет
     * @return true если значение вставлено
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    /**
     * @brief Атомарный read-modify-write для одного ключа
     *
     * fn(current) вызывается под эксклюзивной блокировкой,
     * current == nullptr если ключа нет. Если fn вернул не nullptr,
     * результат заменяет значение; nullptr оставляет карту без изменений.
     */
    template <typename Fn>
    void compute(const K &key, Fn &&fn)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        const std::shared_ptr<V> current = (it != map_.end()) ? it->second : nullptr;

        std::shared_ptr<V> next = std::forward<Fn>(fn)(current);
        if (next) {
            map_[key] = std::move(next);
        }
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
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
