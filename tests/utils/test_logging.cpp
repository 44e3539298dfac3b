#include <catch2/catch.hpp>

#include "walkforge/utils/logging.hpp"

#include <spdlog/spdlog.h>

#include <thread>
#include <vector>

using walkforge::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "walkforge");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging hands every thread the same logger", "[utils][logging]") {
	std::vector<spdlog::logger *> seen(4, nullptr);
	std::vector<std::thread> threads;
	for (std::size_t i = 0; i < seen.size(); ++i) {
		threads.emplace_back([&seen, i]() {
			seen[i] = Logging::getLogger().get();
			WALKFORGE_DEBUG("worker {} ready", i);
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}
	for (auto *logger : seen) {
		REQUIRE(logger == Logging::getLogger().get());
	}
}
