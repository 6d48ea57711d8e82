#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

class DrillqExtension {
public:
	static void Load(ExtensionLoader &loader);
	static std::string Name();
	static std::string Version();
};

} // namespace duckdb
