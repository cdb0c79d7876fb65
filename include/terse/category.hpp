// ==============================================================================
// terse/category.hpp - Категория команды
// ==============================================================================
//
// Назначение:
// - Грубая классификация ядра команды по семейству инструментов
// - Используется как подсказка для предобработки и для выбора промпта LLM
//
// ==============================================================================

#ifndef TERSE_CATEGORY_HPP
#define TERSE_CATEGORY_HPP

#include <string>
#include <string_view>

namespace terse {

enum class Category {
    VersionControl,  // git, svn, hg
    Logs,            // journalctl, dmesg, tail -f, *log*
    FileOperations,  // ls, find, cat, tree, ...
    BuildTest,       // cargo, npm, make, pytest, ...
    ContainerTools,  // docker, podman, kubectl, helm
    Generic,
};

/// "version_control", "logs", "file_operations", "build_test",
/// "container_tools", "generic"
std::string to_string(Category category);

/// Категория по ядру команды (без учёта регистра)
Category detect_category(std::string_view core);

}  // namespace terse

#endif  // TERSE_CATEGORY_HPP
