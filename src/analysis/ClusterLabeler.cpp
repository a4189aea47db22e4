#include "analysis/ClusterLabeler.hpp"
#include "embedding/Tokenizer.hpp"
#include "providers/StructuredOutput.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <boost/asio/post.hpp>

namespace later {

namespace {
    const char* kLabelPrompt =
        "You are a data labeler for clusters of saved articles. "
        "You will be given the summaries of the items in one cluster and must provide "
        "a 1-3 word label describing the cluster's content. "
        "Look for the broader theme where possible. "
        "Respond with JSON matching the requested schema.";

    Rgb hslToRgb(double hue, double saturation, double lightness) {
        hue = std::fmod(std::fmod(hue, 360.0) + 360.0, 360.0);
        double chroma = (1.0 - std::abs(2.0 * lightness - 1.0)) * saturation;
        double segment = hue / 60.0;
        double x = chroma * (1.0 - std::abs(std::fmod(segment, 2.0) - 1.0));

        double r = 0.0, g = 0.0, b = 0.0;
        if (segment < 1) { r = chroma; g = x; }
        else if (segment < 2) { r = x; g = chroma; }
        else if (segment < 3) { g = chroma; b = x; }
        else if (segment < 4) { g = x; b = chroma; }
        else if (segment < 5) { r = x; b = chroma; }
        else { r = chroma; b = x; }

        double match = lightness - chroma / 2.0;
        return {static_cast<int>(std::lround((r + match) * 255.0)),
                static_cast<int>(std::lround((g + match) * 255.0)),
                static_cast<int>(std::lround((b + match) * 255.0))};
    }

    std::uint32_t fnv1a(const std::string& text) {
        std::uint32_t hash = 2166136261u;
        for (unsigned char c : text) {
            hash ^= c;
            hash *= 16777619u;
        }
        return hash;
    }
}

const char* to_string(LabelState state) {
    switch (state) {
        case LabelState::Pending: return "pending";
        case LabelState::Labeled: return "labeled";
        case LabelState::Fallback: return "fallback";
    }
    return "pending";
}

nlohmann::json ClusterLabel::to_json() const {
    nlohmann::json j;
    j["cluster_id"] = clusterId;
    j["label"] = state == LabelState::Pending ? nlohmann::json(nullptr) : nlohmann::json(label);
    j["state"] = to_string(state);
    j["color"] = color;
    return j;
}

// LabelingJob

LabelingJob::LabelingJob(std::vector<ClusterLabel> initial)
    : labels_(std::move(initial)), pending_(0) {
    for (const auto& label : labels_) {
        if (label.state == LabelState::Pending) ++pending_;
    }
}

std::vector<ClusterLabel> LabelingJob::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return labels_;
}

bool LabelingJob::done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ == 0;
}

std::vector<ClusterLabel> LabelingJob::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return pending_ == 0; });
    return labels_;
}

void LabelingJob::resolve(size_t index, std::string label, LabelState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ClusterLabel& entry = labels_.at(index);
        if (entry.state != LabelState::Pending) return;
        entry.color = state == LabelState::Labeled ? ClusterLabeler::colorForLabel(label)
                                                   : ClusterLabeler::kNeutralColor;
        entry.label = std::move(label);
        entry.state = state;
        --pending_;
    }
    cv_.notify_all();
}

// ClusterLabeler

ClusterLabeler::ClusterLabeler(CompletionProvider& provider, const LabelerConfig& config)
    : provider_(provider), config_(config),
      pool_(static_cast<std::size_t>(std::max(1, config.maxConcurrency))) {}

ClusterLabeler::~ClusterLabeler() {
    pool_.join();
}

std::string ClusterLabeler::buildClusterText(const std::vector<std::string>& summaries, int maxTokens) {
    std::vector<std::string> usable;
    std::vector<int> tokens;
    for (const auto& summary : summaries) {
        int count = Tokenizer::countTokens(summary);
        if (count > 0) {
            usable.push_back(summary);
            tokens.push_back(count);
        }
    }
    if (usable.empty()) {
        return "";
    }

    const size_t n = usable.size();
    std::vector<size_t> picked;
    for (size_t take = n; take >= 1; --take) {
        picked.clear();
        int total = 0;
        for (size_t i = 0; i < take; ++i) {
            size_t index = i * n / take;
            picked.push_back(index);
            total += tokens[index];
        }
        if (total <= maxTokens) break;
    }

    std::string text;
    int used = 0;
    for (size_t index : picked) {
        std::string line = usable[index];
        if (used + tokens[index] > maxTokens) {
            // Only reachable when a single summary is over budget
            auto words = Tokenizer::words(line);
            line.clear();
            for (int w = 0; w < maxTokens - used && w < static_cast<int>(words.size()); ++w) {
                if (!line.empty()) line += ' ';
                line += words[w];
            }
            if (line.empty()) break;
        }
        used += Tokenizer::countTokens(line);
        text += "- " + line + "\n";
    }
    return text;
}

Rgb ClusterLabeler::colorForLabel(const std::string& label) {
    double hue = static_cast<double>(fnv1a(label) % 3600u) / 10.0;
    return hslToRgb(hue, 0.58, 0.55);
}

std::string ClusterLabeler::requestLabel(const std::string& clusterText) {
    nlohmann::json output = provider_.complete(kLabelPrompt, "Cluster summaries:\n" + clusterText,
                                               StructuredOutput::labelSchema());
    return StructuredOutput::parseLabel(output);
}

std::shared_ptr<LabelingJob> ClusterLabeler::start(const std::vector<ClusterInput>& clusters) {
    std::vector<ClusterLabel> initial;
    std::vector<std::string> texts;
    for (const auto& cluster : clusters) {
        if (cluster.clusterId < 0) continue;   // unclustered points are never labeled
        ClusterLabel label;
        label.clusterId = cluster.clusterId;
        label.color = kNeutralColor;
        initial.push_back(label);
        texts.push_back(buildClusterText(cluster.memberSummaries, config_.maxTokensPerCluster));
    }

    auto job = std::make_shared<LabelingJob>(initial);
    for (size_t i = 0; i < texts.size(); ++i) {
        if (texts[i].empty()) {
            job->resolve(i, config_.fallbackLabel, LabelState::Fallback);
            continue;
        }
        boost::asio::post(pool_, [this, job, i, text = texts[i]]() {
            try {
                job->resolve(i, requestLabel(text), LabelState::Labeled);
            } catch (const std::exception& e) {
                std::cerr << "[labeler] cluster " << job->snapshot()[i].clusterId
                          << " fell back: " << e.what() << std::endl;
                job->resolve(i, config_.fallbackLabel, LabelState::Fallback);
            } catch (...) {
                std::cerr << "[labeler] cluster " << job->snapshot()[i].clusterId
                          << " fell back: unknown error" << std::endl;
                job->resolve(i, config_.fallbackLabel, LabelState::Fallback);
            }
        });
    }
    return job;
}

std::vector<ClusterLabel> ClusterLabeler::label(const std::vector<ClusterInput>& clusters) {
    return start(clusters)->wait();
}

} // namespace later
