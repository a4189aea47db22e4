#pragma once

#include "core/Config.hpp"
#include "providers/Providers.hpp"
#include <array>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

namespace later {

enum class LabelState { Pending, Labeled, Fallback };

const char* to_string(LabelState state);

using Rgb = std::array<int, 3>;

struct ClusterInput {
    int clusterId = -1;
    std::vector<std::string> memberSummaries;
};

struct ClusterLabel {
    int clusterId = -1;
    std::string label;
    LabelState state = LabelState::Pending;
    Rgb color{};

    nlohmann::json to_json() const;
};

// One labeling run. Every cluster starts pending and moves to labeled or fallback
// as its request finishes; a failure never touches sibling clusters.
class LabelingJob {
public:
    explicit LabelingJob(std::vector<ClusterLabel> initial);

    std::vector<ClusterLabel> snapshot() const;
    bool done() const;

    // Blocks until every cluster has left the pending state
    std::vector<ClusterLabel> wait() const;

    void resolve(size_t index, std::string label, LabelState state);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<ClusterLabel> labels_;
    size_t pending_;
};

class ClusterLabeler {
public:
    ClusterLabeler(CompletionProvider& provider, const LabelerConfig& config = {});
    ~ClusterLabeler();

    ClusterLabeler(const ClusterLabeler&) = delete;
    ClusterLabeler& operator=(const ClusterLabeler&) = delete;

    // Returns immediately; requests run on the labeler's pool. The unclustered
    // sentinel is skipped, and clusters without summaries fall back at once.
    std::shared_ptr<LabelingJob> start(const std::vector<ClusterInput>& clusters);

    // start() followed by wait()
    std::vector<ClusterLabel> label(const std::vector<ClusterInput>& clusters);

    // Non-empty summaries joined one per line, sampled at an even stride when the
    // whole set is over `maxTokens`.
    static std::string buildClusterText(const std::vector<std::string>& summaries, int maxTokens);

    static Rgb colorForLabel(const std::string& label);
    static constexpr Rgb kNeutralColor{128, 132, 140};

private:
    CompletionProvider& provider_;
    LabelerConfig config_;
    boost::asio::thread_pool pool_;

    std::string requestLabel(const std::string& clusterText);
};

} // namespace later
