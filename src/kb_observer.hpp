#pragma once
#include "finding_codec.hpp"

#include <map>
#include <mutex>
#include <string>

// Слушатель событий базы знаний. Фильтрацию по адресу делает сам.
class KbObserver {
public:
    virtual ~KbObserver() = default;

    virtual void append(const std::string& location_a, const std::string& location_b,
                        const KbValue& value, bool ignore_type) {}
    virtual void update(const Finding& old_value, const Finding& new_value) {}
    virtual void add_url(const Url& url) {}
};

// Реестр не владеет слушателями. Слабых ссылок нет: слушатель обязан
// сам вызвать remove() перед уничтожением, иначе реестр только растёт.
class ObserverRegistry {
public:
    int add(KbObserver& observer);
    bool remove(int handle);
    void clear();
    std::size_t size() const;

    // Вызов идёт по снимку реестра, в потоке вызывающего.
    void notify_append(const std::string& location_a, const std::string& location_b,
                       const KbValue& value, bool ignore_type) const;
    void notify_update(const Finding& old_value, const Finding& new_value) const;
    void notify_add_url(const Url& url) const;

private:
    std::map<int, KbObserver*> snapshot() const;

    mutable std::mutex mu_;
    std::map<int, KbObserver*> observers_;
    int last_id_ = 0;
};
