/**
 * @file generator.cpp
 * @brief Generator implementation.
 *
 * @copyright Copyright (c) 2024 timeuuid Contributors
 * @license MIT License
 */

#include "timeuuid/core/generator.hpp"
#include "timeuuid/core/errors.hpp"
#include "timeuuid/utils/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <thread>

namespace timeuuid {
namespace core {

namespace {

std::shared_ptr<TickSource> tickSourceOrDefault(const std::shared_ptr<TickSource>& source) {
    if (source) {
        return source;
    }
    return std::make_shared<SystemTickSource>();
}

std::string resolveStatePath(const GeneratorOptions& options) {
    switch (options.state_mode) {
        case StateMode::Default:
            return StateStore::defaultPath();
        case StateMode::Path:
            if (options.state_path.empty()) {
                throw std::invalid_argument("StateMode::Path requires a state_path");
            }
            return options.state_path;
        case StateMode::Disabled:
            break;
    }
    return {};
}

}  // namespace

Generator::Generator(GeneratorOptions options)
    : clock_(tickSourceOrDefault(options.tick_source))
{
    std::shared_ptr<NodeIdentityProvider> identity = options.node_identity;
    if (!identity) {
        identity = std::make_shared<HardwareNodeIdentity>();
    }

    std::string path = resolveStatePath(options);
    if (!path.empty()) {
        store_ = std::make_unique<StateStore>(path, options.file_mode);
        try {
            StateRecord record = store_->initialize(*identity, clock_.lastTick());
            node_ = record.node;
            sequence_ = record.sequence;
        } catch (const PersistenceUnavailableError& e) {
            fallBackToMemory(e.what());
        }
    }

    if (!store_) {
        node_ = identity->resolve();
        sequence_ = StateStore::randomSequence();
    }

    clock_.reset();

    LOG_INFO("Generator", "Node {} sequence {} state {}",
             formatNodeId(node_), sequence_, store_ ? store_->path() : std::string("(memory)"));
}

std::string Generator::generate(Format format) {
    return render(nextFields(), format);
}

std::string Generator::generate(const std::string& format) {
    return generate(formatFromString(format));
}

UuidFields Generator::nextFields() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto tick = clock_.nextTick([this] { rolloverLocked(); });
            if (tick) {
                return fieldsFromTick(*tick, sequence_, node_);
            }
        }
        // Drift budget spent: let the wall clock catch up.
        std::this_thread::yield();
    }
}

uint32_t Generator::nextSequence() {
    std::lock_guard<std::mutex> lock(mutex_);
    rolloverLocked();
    clock_.reset();
    return sequence_;
}

void Generator::rolloverLocked() {
    if (store_) {
        try {
            StateRecord fallback;
            fallback.node = node_;
            fallback.sequence = sequence_;
            StateRecord record = store_->rollover(fallback, clock_.lastTick());
            node_ = record.node;
            sequence_ = record.sequence;
            LOG_DEBUG("Generator", "Sequence rolled over to {}", sequence_);
            return;
        } catch (const PersistenceUnavailableError& e) {
            fallBackToMemory(e.what());
        }
    }
    ++sequence_;
    LOG_DEBUG("Generator", "In-memory sequence advanced to {}", sequence_);
}

void Generator::fallBackToMemory(const std::string& reason) {
    LOG_WARN("Generator", "State file unavailable, using in-memory sequence: {}", reason);
    store_.reset();
}

std::string Generator::translate(const std::string& value, Format source, Format target) {
    if (source == target) {
        throw NoopTranslationError(formatToString(source));
    }
    return render(parse(value, source), target);
}

std::string Generator::translate(const std::string& value,
                                 const std::string& source,
                                 const std::string& target) {
    Format from = formatFromString(source);
    Format to = formatFromString(target);
    return translate(value, from, to);
}

uint64_t Generator::node() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return node_;
}

uint32_t Generator::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

std::string Generator::statePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_ ? store_->path() : std::string();
}

std::string Generator::describe() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    oss << "MAC: " << formatNodeId(node_) << "  Sequence: " << sequence_;
    return oss.str();
}

}  // namespace core
}  // namespace timeuuid
