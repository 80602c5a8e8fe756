#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

/// @brief Unique directory under the system temp path, removed with everything in it on destruction.
class TemporaryDirectory
{
private:
	std::filesystem::path Root{};

public:
	TemporaryDirectory()
	{
		std::string Template{(std::filesystem::temp_directory_path() / "applocker_test_XXXXXX").string()};
		if (::mkdtemp(Template.data()) == nullptr)
		{
			throw std::runtime_error("mkdtemp failed");
		}
		Root = Template;
	}
	~TemporaryDirectory()
	{
		std::error_code ErrorCode{};
		std::filesystem::remove_all(Root, ErrorCode);
	}
	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

	const std::filesystem::path &Path() const { return Root; }

	void WriteFile(const std::filesystem::path &Relative, const std::string &Content) const
	{
		const std::filesystem::path Full{Root / Relative};
		std::filesystem::create_directories(Full.parent_path());
		std::ofstream Output{Full, std::ios::binary | std::ios::trunc};
		Output << Content;
	}
};
