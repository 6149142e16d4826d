#include <arpg/affix/buff_timer_manager.hpp>
#include <arpg/core/log.hpp>

namespace arpg::affix {

BuffActivation BuffTimerManager::activate(std::string_view stat_key, float value, double duration) {
    if (duration <= 0.0) {
        return BuffActivation::Ignored;
    }

    auto it = m_buffs.find(stat_key);
    if (it != m_buffs.end()) {
        ActiveBuff& buff = it->second;
        buff.value = value;
        buff.duration = duration;
        buff.remaining_seconds = duration;
        return BuffActivation::Refreshed;
    }

    ActiveBuff buff;
    buff.stat_key = std::string(stat_key);
    buff.value = value;
    buff.duration = duration;
    buff.remaining_seconds = duration;
    m_buffs.emplace(buff.stat_key, std::move(buff));

    core::log(core::LogLevel::Trace, "[Affix] Buff {} applied ({}s)", stat_key, duration);
    return BuffActivation::Applied;
}

size_t BuffTimerManager::tick(double dt) {
    size_t expired = 0;
    for (auto it = m_buffs.begin(); it != m_buffs.end();) {
        it->second.remaining_seconds -= dt;
        if (it->second.is_expired()) {
            core::log(core::LogLevel::Trace, "[Affix] Buff {} expired", it->first);
            it = m_buffs.erase(it);
            ++expired;
        } else {
            ++it;
        }
    }
    return expired;
}

const ActiveBuff* BuffTimerManager::get(std::string_view stat_key) const {
    auto it = m_buffs.find(stat_key);
    return it != m_buffs.end() ? &it->second : nullptr;
}

bool BuffTimerManager::is_active(std::string_view stat_key) const {
    const ActiveBuff* buff = get(stat_key);
    return buff && !buff->is_expired();
}

} // namespace arpg::affix
