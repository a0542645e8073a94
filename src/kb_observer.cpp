#include "kb_observer.hpp"

int ObserverRegistry::add(KbObserver& observer) {
    std::lock_guard<std::mutex> lk(mu_);
    int id = ++last_id_;
    observers_[id] = &observer;
    return id;
}

bool ObserverRegistry::remove(int handle) {
    std::lock_guard<std::mutex> lk(mu_);
    return observers_.erase(handle) != 0;
}

void ObserverRegistry::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    observers_.clear();
}

std::size_t ObserverRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return observers_.size();
}

std::map<int, KbObserver*> ObserverRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return observers_;
}

void ObserverRegistry::notify_append(const std::string& location_a, const std::string& location_b,
                                     const KbValue& value, bool ignore_type) const {
    for (const auto& [id, obs] : snapshot()) obs->append(location_a, location_b, value, ignore_type);
}

void ObserverRegistry::notify_update(const Finding& old_value, const Finding& new_value) const {
    for (const auto& [id, obs] : snapshot()) obs->update(old_value, new_value);
}

void ObserverRegistry::notify_add_url(const Url& url) const {
    for (const auto& [id, obs] : snapshot()) obs->add_url(url);
}
