#pragma once
#include <memory>
#include <optional>
#include <string>

namespace jsbox {

/**
 * Handler source with an optional base path used to resolve its relative imports. Copies share the
 * same immutable source text.
 */
class Script {
	public:
		static auto FromContent(std::string content) -> Script;
		// The base path becomes the file's parent directory
		static auto FromFile(const std::string& path) -> Script;

		auto WithVirtualBase(std::string path) && -> Script;

		auto Content() const -> const std::string& { return *content; }
		auto BasePath() const -> const std::optional<std::string>& { return base_path; }

	private:
		Script(std::shared_ptr<const std::string> content, std::optional<std::string> base_path);

		std::shared_ptr<const std::string> content;
		std::optional<std::string> base_path;
};

} // namespace jsbox
