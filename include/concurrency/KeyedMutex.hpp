#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mds::concurrency {

// One mutex per key, created on first use and kept for the owner's lifetime
class KeyedMutex {
public:
    [[nodiscard]] std::unique_lock<std::mutex> lock(const std::string& key) {
        std::shared_ptr<std::mutex> m;
        {
            std::scoped_lock guard(mapMutex_);
            auto& slot = locks_[key];
            if (!slot) slot = std::make_shared<std::mutex>();
            m = slot;
        }
        return std::unique_lock(*m);
    }

private:
    std::mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}
