// ==============================================================================
// registry.cpp - Реестр оптимизаторов
// ==============================================================================

#include "terse/optimizer.hpp"

#include <iterator>

namespace terse::optimizer {

Registry::Registry(std::vector<std::unique_ptr<Optimizer>> optimizers)
    : optimizers_(std::move(optimizers)) {
    // Универсальный оптимизатор допустим только последним
    for (auto it = optimizers_.begin(); it != optimizers_.end();) {
        if (*it == nullptr || ((*it)->is_fallback() && std::next(it) != optimizers_.end())) {
            it = optimizers_.erase(it);
        } else {
            ++it;
        }
    }
    if (optimizers_.empty() || !optimizers_.back()->is_fallback()) {
        optimizers_.push_back(std::make_unique<GenericOptimizer>());
    }
}

Registry Registry::with_defaults(const Settings& settings) {
    std::vector<std::unique_ptr<Optimizer>> list;
    if (settings.git.enabled) {
        list.push_back(std::make_unique<GitOptimizer>(settings.git));
    }
    if (settings.file.enabled) {
        list.push_back(std::make_unique<FileOptimizer>(settings.file));
    }
    if (settings.build.enabled) {
        list.push_back(std::make_unique<BuildOptimizer>(settings.build));
    }
    if (settings.docker.enabled) {
        list.push_back(std::make_unique<DockerOptimizer>(settings.docker));
    }
    list.push_back(std::make_unique<GenericOptimizer>(settings.generic));
    return Registry(std::move(list));
}

const Optimizer* Registry::select(const command::CommandContext& ctx) const {
    for (const auto& opt : optimizers_) {
        if (opt->can_handle(ctx)) {
            return opt.get();
        }
    }
    return optimizers_.back().get();
}

const Optimizer* Registry::select_specialized(const command::CommandContext& ctx) const {
    const Optimizer* opt = select(ctx);
    return opt->is_fallback() ? nullptr : opt;
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> result;
    result.reserve(optimizers_.size());
    for (const auto& opt : optimizers_) {
        result.push_back(opt->name());
    }
    return result;
}

std::string cap_lines(const std::vector<std::string>& lines, size_t max, std::string_view what) {
    std::string out;
    const size_t shown = lines.size() < max ? lines.size() : max;
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    if (lines.size() > shown) {
        if (!out.empty()) {
            out += '\n';
        }
        out += "...+" + std::to_string(lines.size() - shown) + " more " + std::string(what);
    }
    return out;
}

}  // namespace terse::optimizer
