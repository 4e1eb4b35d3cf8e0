#include "backend_launcher/Manifest.hpp"
#include "backend_launcher/Strings.hpp"

#include <fstream>
#include <iterator>

namespace bklaunch {

	bool isProtectedEntry(std::string_view line, const std::vector<std::string>& markers)
	{
		const std::string_view t = trimView(line);
		for (const auto& m : markers)
		{
			if (!m.empty() && startsWith(t, m)) return true;
		}
		return false;
	}

	std::vector<std::string> filterManifestLines(std::string_view content, const std::vector<std::string>& markers)
	{
		std::vector<std::string> out;
		while (!content.empty())
		{
			const auto pos = content.find('\n');
			std::string_view line = content.substr(0, pos);
			if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

			if (!isProtectedEntry(line, markers)) out.emplace_back(line);

			if (pos == std::string_view::npos) break;
			content.remove_prefix(pos + 1);
		}
		return out;
	}

	bool writeFilteredManifest(DependencyManifest& manifest, const std::vector<std::string>& markers, std::string* error)
	{
		std::string content;
		{
			std::ifstream in(manifest.sourcePath, std::ios::binary);
			if (!in)
			{
				if (error) *error = "Failed to read manifest: " + manifest.sourcePath.string();
				return false;
			}
			content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
		}

		manifest.filteredEntries = filterManifestLines(content, markers);

		std::ofstream f(manifest.filteredPath, std::ios::binary | std::ios::trunc);
		if (!f)
		{
			if (error) *error = "Failed to open filtered manifest for writing: " + manifest.filteredPath.string();
			return false;
		}
		for (const auto& e : manifest.filteredEntries) f << e << '\n';
		f.flush();
		if (!f)
		{
			if (error) *error = "Failed to write filtered manifest: " + manifest.filteredPath.string();
			return false;
		}
		return true;
	}

};//---namespace bklaunch
