#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>

#include <boost/core/noncopyable.hpp>

#include <exception/Error.hpp>
#include <threads/Periodic.hpp>
#include <unsorted/Env.hpp>
#include <unsorted/Log4cxx.hpp>

// read-through cache with optional expiration.
// hit: one shared lock on directory.
// miss: exclusive lock on directory to reserve entry, then entry mutex to compute value.
namespace Cache::Loading {
    using namespace std::chrono_literals;

    inline log4cxx::LoggerPtr sLogger = Logger::Get("cache");

    struct Config
    {
        static constexpr std::chrono::milliseconds DEFAULT_PURGE_INTERVAL = 30s;

        std::optional<std::chrono::milliseconds> expiration;
        std::chrono::milliseconds                purge_interval = DEFAULT_PURGE_INTERVAL;
        std::string                              name           = "cache";

        static Config fromEnv(const std::string& aPrefix = "CACHE")
        {
            Config sConfig;
            if (auto sValue = Util::getEnv((aPrefix + "_EXPIRATION").c_str()); !sValue.empty())
                sConfig.expiration = Util::parseDuration(sValue);
            sConfig.purge_interval = Util::getDuration((aPrefix + "_PURGE_INTERVAL").c_str(), sConfig.purge_interval);
            if (auto sValue = Util::getEnv((aPrefix + "_NAME").c_str()); !sValue.empty())
                sConfig.name = sValue;
            return sConfig;
        }

        template <class Clock = std::chrono::steady_clock>
        void validate() const;
    };

    using ConfigError = Exception::Error<Config, std::invalid_argument>;

    // durations are added to Clock::now(), keep half of clock range as headroom
    template <class Clock>
    void Config::validate() const
    {
        const auto sLimit = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()) / 2;

        if (purge_interval <= 0ms)
            throw ConfigError("purge interval must be positive");
        if (purge_interval > sLimit)
            throw ConfigError("purge interval too large");
        if (expiration and *expiration < 0ms)
            throw ConfigError("expiration must not be negative");
        if (expiration and *expiration > sLimit)
            throw ConfigError("expiration too large");
    }

    template <class Key, class Value, class Clock>
    struct Entry : public boost::noncopyable
    {
        using TimePoint = typename Clock::time_point;
        using Age       = typename std::list<Key>::iterator;

        const std::optional<TimePoint> expires_at;
        const Age                      age;

        std::mutex        mutex; // held while value is computed
        Value             value{};
        std::atomic<bool> computed{false};

        Entry(std::optional<TimePoint> aExpiresAt, Age aAge)
        : expires_at(aExpiresAt)
        , age(aAge)
        {
        }

        Entry(std::optional<TimePoint> aExpiresAt, Age aAge, Value&& aValue)
        : expires_at(aExpiresAt)
        , age(aAge)
        , value(std::move(aValue))
        , computed(true)
        {
        }

        bool expired(TimePoint aNow) const
        {
            return expires_at and *expires_at <= aNow;
        }
    };

    // Value must be default constructible (placeholder until computed) and copyable (Get returns a copy).
    // use std::shared_ptr or std::optional to cache absent results.
    template <class Key, class Value, class Clock = std::chrono::steady_clock>
    class Manager : public boost::noncopyable
    {
        static_assert(std::is_default_constructible_v<Value>, "Cache::Loading: Value must be default constructible");
        static_assert(std::is_copy_constructible_v<Value>, "Cache::Loading: Value must be copyable");

    public:
        using Compute = std::function<Value(const Key&)>;

    private:
        using Entry     = Loading::Entry<Key, Value, Clock>;
        using EntryPtr  = std::shared_ptr<Entry>;
        using TimePoint = typename Clock::time_point;
        using Age       = std::list<Key>;
        using Index     = std::unordered_map<Key, EntryPtr>;

        const Config  m_Config;
        const Compute m_Compute;

        mutable std::shared_mutex m_Mutex;
        Index                     m_Index;
        Age                       m_Age; // keys in creation order, oldest first

        Threads::Periodic m_Periodic;

        std::optional<TimePoint> deadline() const
        {
            if (!m_Config.expiration)
                return std::nullopt;
            return Clock::now() + *m_Config.expiration;
        }

        static const Config& validated(const Config& aConfig)
        {
            aConfig.validate<Clock>();
            return aConfig;
        }

        EntryPtr reserve(const Key& aKey)
        {
            std::unique_lock sLock(m_Mutex);

            // someone could insert entry since we checked
            auto sIt = m_Index.find(aKey);
            if (sIt != m_Index.end())
                return sIt->second;

            auto sAge = m_Age.insert(m_Age.end(), aKey);
            try {
                auto sEntry = std::make_shared<Entry>(deadline(), sAge);
                m_Index.emplace(aKey, sEntry);
                return sEntry;
            } catch (...) {
                m_Age.erase(sAge);
                throw;
            }
        }

        Value compute(const Key& aKey, Entry& aEntry)
        {
            std::unique_lock sLock(aEntry.mutex);
            if (!aEntry.computed.load(std::memory_order_relaxed)) {
                aEntry.value = m_Compute(aKey);
                aEntry.computed.store(true, std::memory_order_release);
            }
            return aEntry.value;
        }

    public:
        explicit Manager(Compute aCompute, const Config& aConfig = {})
        : m_Config(validated(aConfig))
        , m_Compute(std::move(aCompute))
        {
            if (!m_Compute)
                throw std::invalid_argument("Cache::Loading: compute function required");

            if (m_Config.expiration) {
                m_Periodic.start(m_Config.name, m_Config.purge_interval, [this]() {
                    const size_t sCount = Purge();
                    if (sCount > 0)
                        DEBUG(m_Config.name << ": purged " << sCount << " expired entries");
                });
                INFO(m_Config.name << ": sweeper started, expiration " << m_Config.expiration->count() << "ms, interval " << m_Config.purge_interval.count() << "ms");
            }
        }

        ~Manager()
        {
            m_Periodic.stop();
            m_Periodic.wait();
        }

        // returns cached value, or computes it.
        // if several threads ask for the same missing key, only one calls compute function.
        Value Get(const Key& aKey)
        {
            EntryPtr sEntry;
            {
                std::shared_lock sLock(m_Mutex);
                auto             sIt = m_Index.find(aKey);
                if (sIt != m_Index.end())
                    sEntry = sIt->second;
            }

            // value never changes once computed flag is set
            if (sEntry and sEntry->computed.load(std::memory_order_acquire))
                return sEntry->value;

            if (!sEntry)
                sEntry = reserve(aKey);
            return compute(aKey, *sEntry);
        }

        void Set(const Key& aKey, Value aValue)
        {
            std::unique_lock sLock(m_Mutex);

            auto sIt = m_Index.find(aKey);
            if (sIt != m_Index.end()) {
                m_Age.erase(sIt->second->age);
                sIt->second.reset();
            }

            auto sAge = m_Age.insert(m_Age.end(), aKey);
            try {
                auto sEntry = std::make_shared<Entry>(deadline(), sAge, std::move(aValue));
                if (sIt != m_Index.end())
                    sIt->second = std::move(sEntry);
                else
                    m_Index.emplace(aKey, std::move(sEntry));
            } catch (...) {
                m_Age.erase(sAge);
                if (sIt != m_Index.end())
                    m_Index.erase(sIt);
                throw;
            }
        }

        // remove expired entries from the head of age list.
        // stops on first alive entry, so entry with shorter lifetime can stay until next pass.
        size_t Purge()
        {
            const auto sNow   = Clock::now();
            size_t     sCount = 0;

            std::unique_lock sLock(m_Mutex);
            while (!m_Age.empty()) {
                auto sIt = m_Index.find(m_Age.front());
                if (sIt == m_Index.end())
                    throw std::logic_error("Cache::Loading: age list out of sync with index");
                if (!sIt->second->expired(sNow))
                    break;
                m_Index.erase(sIt);
                m_Age.pop_front();
                sCount++;
            }
            return sCount;
        }

        // sweeper exits on next wake up. Get and Set keep working.
        void Shutdown()
        {
            if (m_Periodic.stop())
                INFO(m_Config.name << ": shutdown");
        }

        size_t Size() const
        {
            std::shared_lock sLock(m_Mutex);
            return m_Index.size();
        }

#ifdef BOOST_TEST_MESSAGE
        template <class T>
        void Debug(T&& aHandler) const
        {
            std::shared_lock sLock(m_Mutex);
            for (auto& x : m_Age)
                aHandler(x, *m_Index.at(x));
        }
#endif
    };
} // namespace Cache::Loading
