//
// Created by gregorian-rayne on 2/15/26.
//

#include "pinch/cli/commands/graph_loader.hpp"
#include "pinch/analysis/graph_diff.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

namespace pinch::cli
{
    namespace {

        /**
         * Resolves "core" differently depending on which checkout it lives in.
         */
        class CheckoutResolver final : public resolve::PackageResolver {
        public:
            [[nodiscard]] std::string name() const override { return "checkout"; }

            [[nodiscard]] Result<resolve::ResolvedPackage, Error> resolve(
                const resolve::ResolutionRoot& root) const override {
                ++calls_;
                resolve::ResolvedPackage nio{"swift-nio", "swift-nio", {}};
                resolve::ResolvedPackage log{"swift-log", "swift-log", {}};
                resolve::ResolvedPackage core{"core", "Core", {nio}};
                if (root.directory.generic_string().find("/after/") != std::string::npos) {
                    core.dependencies.push_back(log);
                }
                return Result<resolve::ResolvedPackage, Error>::success(core);
            }

            [[nodiscard]] std::size_t calls() const { return calls_.load(); }

        private:
            mutable std::atomic<std::size_t> calls_{0};
        };

    }  // namespace

    class GraphLoaderTest : public ::testing::Test {
    protected:
        void SetUp() override {
            root_ = fs::temp_directory_path() / "pinch_graph_loader_test";
            fs::remove_all(root_);
            write_core("before");
            write_core("after");
        }

        void TearDown() override {
            fs::remove_all(root_);
        }

        void write_core(const std::string& checkout) const {
            const auto dir = root_ / checkout / "core";
            fs::create_directories(dir);
            std::ofstream file(dir / "core.deps.json");
            file << R"({"records": [{"name": "Core", "path": ".", )"
                 << R"("dependencies": ["swift-nio"], "explicitDependencies": ["Core"]}]})";
        }

        fs::path root_;
    };

    TEST_F(GraphLoaderTest, EachSideOfADiffResolvesInItsOwnCheckout) {
        const auto resolver = std::make_shared<CheckoutResolver>();
        graph::BuildOptions options;
        options.flags.augment = true;
        options.resolver = resolver;

        const auto loaded = load_graph_pair(root_ / "before", root_ / "after", options);
        ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();

        const auto& pair = loaded.value();
        EXPECT_EQ(pair.resolver_invocations, 2u);
        EXPECT_EQ(resolver->calls(), 2u);

        const auto changes = analysis::diff(pair.from.report.graph, pair.to.report.graph);
        EXPECT_EQ(changes.added_nodes, std::vector<std::string>{"module:swift-log"});
        EXPECT_EQ(changes.added_edges, std::vector<std::string>{"module:core->module:swift-log"});
        EXPECT_TRUE(changes.removed_edges.empty());
    }

    TEST_F(GraphLoaderTest, MissingSideIsAnError) {
        const auto loaded = load_graph_pair(root_ / "before", root_ / "absent", graph::BuildOptions{});

        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::NotFound);
    }

}  // namespace pinch::cli
