/**
 * @file discpack.cpp
 * @brief Implementation of the public DiscPack API.
 */

#include "../../include/discpack.hpp"

#include "../../include/archive_builder.hpp"
#include "../../include/buffer_selector.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/part_budget.hpp"
#include "../../include/part_executor.hpp"

#include <stdexcept>
#include <system_error>

namespace discpack {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    DiscPackObserver* observer_;
public:
    explicit BridgeLogSink(DiscPackObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

// keeps the bridge sink registered for the duration of one pack() call
class ScopedBridgeSink {
    const ILogSink* sink_ = nullptr;
public:
    explicit ScopedBridgeSink(DiscPackObserver* obs) {
        if (!obs) return;
        auto sink = std::make_unique<BridgeLogSink>(obs);
        sink_ = sink.get();
        Logger::add_sink(std::move(sink));
    }
    ~ScopedBridgeSink() {
        if (sink_) Logger::remove_sink(sink_);
    }

    ScopedBridgeSink(const ScopedBridgeSink&) = delete;
    ScopedBridgeSink& operator=(const ScopedBridgeSink&) = delete;
};

struct DiscPack::Impl {
    PartBudget budget{mb_to_bytes(kDefaultPartSizeMb), mb_to_bytes(kDefaultThresholdMb)};
    std::filesystem::path outputDir;
    MemoryProbe probe = query_available_memory;
    int compressionLevel = ArchiveBuilder::kDefaultCompressionLevel;
    bool dryRun = false;

    DiscPackObserver* observer = nullptr;

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;

        bus.subscribe<PartPlannedEvent>([obs = observer](const PartPlannedEvent& e) {
            obs->onPartStart(e.index, e.file_count, e.input_bytes);
        });

        bus.subscribe<PartWriteCompleteEvent>([obs = observer](const PartWriteCompleteEvent& e) {
            OutputArtifact artifact;
            artifact.part_index = e.index;
            artifact.path = e.path;
            artifact.size_bytes = e.archive_bytes;
            obs->onPartFinish(artifact, e.kind == BufferKind::Memory);
        });

        bus.subscribe<PartErrorEvent>([obs = observer](const PartErrorEvent& e) {
            obs->onPartError(e.index, e.error_message);
        });
    }
};

DiscPack::DiscPack() : impl_(std::make_unique<Impl>()) {}

DiscPack::~DiscPack() = default;

DiscPack::DiscPack(DiscPack&&) noexcept = default;
DiscPack& DiscPack::operator=(DiscPack&&) noexcept = default;

DiscPack& DiscPack::partSize(const std::uint64_t bytes) {
    impl_->budget.max_part_size_bytes = bytes;
    return *this;
}

DiscPack& DiscPack::memoryThreshold(const std::uint64_t bytes) {
    impl_->budget.memory_threshold_bytes = bytes;
    return *this;
}

DiscPack& DiscPack::outputDirectory(const std::filesystem::path& dir) {
    impl_->outputDir = dir;
    return *this;
}

DiscPack& DiscPack::memoryProbe(MemoryProbe probe) {
    impl_->probe = std::move(probe);
    return *this;
}

DiscPack& DiscPack::compressionLevel(const int level) {
    impl_->compressionLevel = level;
    return *this;
}

DiscPack& DiscPack::dryRun(const bool val) {
    impl_->dryRun = val;
    return *this;
}

void DiscPack::setObserver(DiscPackObserver* observer) {
    impl_->observer = observer;
}

std::vector<OutputArtifact> DiscPack::pack(const std::filesystem::path& input_dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(input_dir, ec)) {
        throw std::invalid_argument("The input directory '" + input_dir.string() + "' does not exist.");
    }
    return pack(list_files_recursive(input_dir));
}

std::vector<OutputArtifact> DiscPack::pack(const std::vector<SourceFile>& files) {
    if (impl_->budget.max_part_size_bytes == 0) {
        throw std::invalid_argument("Part size must be greater than zero.");
    }
    if (impl_->outputDir.empty()) {
        throw std::invalid_argument("An output directory must be specified.");
    }

    // observer only hears log lines emitted by this run
    const ScopedBridgeSink bridge(impl_->observer);

    if (!impl_->dryRun) {
        std::error_code ec;
        if (!std::filesystem::exists(impl_->outputDir, ec)) {
            Logger::log(LogLevel::Info, "Creating output directory '" + impl_->outputDir.string() + "'.", "DiscPack");
            std::filesystem::create_directories(impl_->outputDir);
        }
    }

    EventBus bus;
    impl_->setupEventBridging(bus);

    const BufferSelector selector(impl_->probe);
    const ArchiveBuilder builder(impl_->compressionLevel);
    PartExecutor executor(selector, builder, impl_->budget, impl_->outputDir, bus, impl_->dryRun);
    return executor.run(files);
}

} // namespace discpack
