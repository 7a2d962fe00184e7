#include <unit_test.hpp>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <vector>

namespace uj {
namespace {
struct Assert {};

// function local: test cases register during static initialization
auto get_tests() -> std::vector<test::TestCase const*>& {
	static auto ret = std::vector<test::TestCase const*>{};
	return ret;
}

bool g_failed{};

void print_failure(std::string_view const type, std::string_view const expr, std::string_view const file, int const line) {
	std::cerr << "  " << type << " failed: '" << expr << "' [" << std::filesystem::path{file}.filename().string() << ":" << line << "]\n";
}
} // namespace

void test::check_expect(bool const pred, std::string_view const expr, std::string_view const file, int const line) {
	if (pred) { return; }
	print_failure("expectation", expr, file, line);
	g_failed = true;
}

void test::check_assert(bool const pred, std::string_view const expr, std::string_view const file, int const line) {
	if (pred) { return; }
	print_failure("assertion", expr, file, line);
	g_failed = true;
	throw Assert{};
}

test::TestCase::TestCase(std::string_view const name) : name(name) { get_tests().push_back(this); }

auto test::run_tests() -> int {
	auto const& tests = get_tests();
	if (tests.empty()) {
		std::cout << "no tests to run\n";
		return EXIT_SUCCESS;
	}

	auto failed = 0;
	for (auto const* test : tests) {
		g_failed = false;
		try {
			test->run();
		} catch (Assert const&) {
			// already reported
		} catch (std::exception const& e) {
			std::cerr << "  exception: " << e.what() << "\n";
			g_failed = true;
		}
		if (g_failed) {
			std::cerr << "[FAILED] " << test->name << "\n";
			++failed;
			continue;
		}
		std::cout << "[passed] " << test->name << "\n";
	}

	if (failed > 0) {
		std::cerr << "\n" << failed << " of " << tests.size() << " test(s) failed\n";
		return EXIT_FAILURE;
	}
	std::cout << "\nok: [" << tests.size() << "] test(s) passed\n";
	return EXIT_SUCCESS;
}
} // namespace uj
