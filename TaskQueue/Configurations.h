#pragma once

#include "LeaseSweeper.h"
#include "TaskTypes.h"
#include "WorkerRuntime.h"

#include "ArgumentParser.h"
#include "Logger.h"

#include <string>

using namespace Utilities;

class Configurations
{
public:
	Configurations(ArgumentParser&& arguments);
	virtual ~Configurations(void);

	auto write_file() -> LogTypes;
	auto write_console() -> LogTypes;
	auto log_root() -> std::string;

	auto root_path() -> std::string;
	auto config_path() -> std::string;

	auto store_config() -> StoreConfig;
	auto worker_config() -> WorkerConfig;
	auto sweeper_config() -> SweeperConfig;
	auto run_sweeper() -> bool;
	auto max_concurrent_claimers() -> int32_t;

protected:
	auto load() -> void;
	auto parse(ArgumentParser& arguments) -> void;
	auto validate() -> void;

private:
	LogTypes write_file_;
	LogTypes write_console_;
	std::string log_root_;

	std::string root_path_;
	std::string config_path_;

	StoreConfig store_config_;
	WorkerConfig worker_config_;
	SweeperConfig sweeper_config_;
	bool run_sweeper_;
	int32_t max_concurrent_claimers_;
};
