#include "dashboard.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <string>

using plx::Dashboard;
using plx::DisplayModel;
using plx::Launcher;
using plx::ProjectField;
using plx::test::MemoryProjectStore;
using plx::test::RecordingSpawner;
using plx::test::make_project;

namespace {

class DashboardTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.stored = {
            make_project("web", "/srv/web", "npm start", "apps", "http://localhost:3000"),
            make_project("api", "/srv/api", "go run .", "apps"),
            make_project("notes", "/mnt/c/notes", "notes.exe", ""),
        };
        dashboard_.start();
        dashboard_.handle_resize(120, 30);
    }

    void press(const std::string& keys) {
        for (char c : keys) {
            dashboard_.handle_key(std::string(1, c));
        }
    }

    int cursor() const { return dashboard_.view_model().project_table.cursor; }

    const plx::StatusBarViewModel& status() const { return dashboard_.view_model().status_bar; }

    MemoryProjectStore store_;
    RecordingSpawner spawner_;
    DisplayModel model_{&store_};
    Launcher launcher_{&spawner_};
    Dashboard dashboard_{&model_, &launcher_};
};

} // namespace

// Rows: [apps], api, web, [N/A], notes

TEST_F(DashboardTest, StartBuildsTable) {
    const auto& vm = dashboard_.view_model();
    EXPECT_TRUE(vm.has_projects);
    EXPECT_EQ(vm.project_table.rows.size(), 5u);
    EXPECT_EQ(vm.project_table.height, 24);
    EXPECT_EQ(cursor(), 0);
    EXPECT_TRUE(dashboard_.running());
}

TEST_F(DashboardTest, NavigationKeysMoveCursorWithinBounds) {
    dashboard_.handle_key("down");
    dashboard_.handle_key("j");
    EXPECT_EQ(cursor(), 2);
    dashboard_.handle_key("k");
    EXPECT_EQ(cursor(), 1);
    dashboard_.handle_key("G");
    EXPECT_EQ(cursor(), 4);
    dashboard_.handle_key("down");
    EXPECT_EQ(cursor(), 4);
    dashboard_.handle_key("g");
    EXPECT_EQ(cursor(), 0);
    dashboard_.handle_key("pgdown");
    EXPECT_EQ(cursor(), 4);
    dashboard_.handle_key("pgup");
    EXPECT_EQ(cursor(), 0);
    dashboard_.handle_key("end");
    dashboard_.handle_key("ctrl+u");
    EXPECT_EQ(cursor(), 0);
}

TEST_F(DashboardTest, WheelMovesCursor) {
    dashboard_.handle_wheel(3);
    EXPECT_EQ(cursor(), 3);
    dashboard_.handle_wheel(-10);
    EXPECT_EQ(cursor(), 0);
}

TEST_F(DashboardTest, LaunchOnHeaderDoesNothing) {
    dashboard_.handle_key("enter");
    EXPECT_TRUE(spawner_.requests.empty());
    EXPECT_TRUE(status().message.empty());
}

TEST_F(DashboardTest, LaunchSelectedRecord) {
    dashboard_.handle_key("down");
    dashboard_.handle_key(" ");

    ASSERT_EQ(spawner_.requests.size(), 1u);
    EXPECT_EQ(spawner_.requests[0].argv[2], "cd '/srv/api' && go run .");
    EXPECT_EQ(status().message, "Launched api");
    EXPECT_FALSE(status().is_error);
    EXPECT_TRUE(status().visible(Dashboard::Clock::now()));
}

TEST_F(DashboardTest, LaunchFailureShowsError) {
    spawner_.fail_with = "powershell.exe: command not found";
    dashboard_.handle_key("G");
    dashboard_.handle_key("enter");

    EXPECT_EQ(status().message, "Failed to launch notes: powershell.exe: command not found");
    EXPECT_TRUE(status().is_error);
}

TEST_F(DashboardTest, StatusExpiresAfterThreeSeconds) {
    dashboard_.handle_key("r");
    ASSERT_EQ(status().message, "Refreshed");

    const auto now = Dashboard::Clock::now();
    EXPECT_TRUE(status().visible(now));
    EXPECT_FALSE(status().visible(now + std::chrono::seconds(4)));
}

TEST_F(DashboardTest, OpenLink) {
    press("jj");
    dashboard_.handle_key("o");
    ASSERT_EQ(spawner_.requests.size(), 1u);
    EXPECT_EQ(status().message, "Opened web link in browser");

    dashboard_.handle_key("k");
    dashboard_.handle_key("o");
    EXPECT_EQ(spawner_.requests.size(), 1u);
    EXPECT_EQ(status().message, "No link associated");
}

TEST_F(DashboardTest, AddStartsEditingNewRecordUnderCursor) {
    dashboard_.handle_key("n");

    ASSERT_EQ(model_.projects().size(), 4u);
    EXPECT_EQ(store_.stored.size(), 4u);
    EXPECT_EQ(status().message, "New project added");
    ASSERT_TRUE(dashboard_.editing());

    const auto& session = dashboard_.edit_session();
    EXPECT_EQ(session.original_index(), 3);
    EXPECT_EQ(session.field(), ProjectField::Name);
    EXPECT_EQ(session.input().value(), "New Project");

    // [apps], api, web, [N/A], New Project, notes
    EXPECT_EQ(cursor(), 4);
    EXPECT_EQ(model_.record_for_display_row(cursor())->name, "New Project");
}

TEST_F(DashboardTest, AddWithFailingStoreReportsError) {
    store_.fail_saves = true;
    dashboard_.handle_key("a");

    EXPECT_EQ(status().message, "Failed to save catalog: disk full");
    EXPECT_TRUE(status().is_error);
    EXPECT_EQ(model_.projects().size(), 4u);
}

TEST_F(DashboardTest, EditCommitFollowsRecord) {
    dashboard_.handle_key("down");  // api
    dashboard_.handle_key("e");
    ASSERT_TRUE(dashboard_.editing());

    dashboard_.handle_key("ctrl+u");
    press("zed");
    dashboard_.handle_key("enter");

    EXPECT_FALSE(dashboard_.editing());
    EXPECT_EQ(model_.projects()[1].name, "zed");
    EXPECT_EQ(store_.stored[1].name, "zed");
    EXPECT_EQ(status().message, "Project updated");
    // Now sorts after web
    EXPECT_EQ(cursor(), 2);
    EXPECT_EQ(model_.record_for_display_row(cursor())->name, "zed");
}

TEST_F(DashboardTest, EditModeSendsLettersToInput) {
    dashboard_.handle_key("down");
    dashboard_.handle_key("e");
    press("qd r");

    EXPECT_TRUE(dashboard_.running());
    EXPECT_TRUE(dashboard_.editing());
    EXPECT_EQ(dashboard_.edit_session().input().value(), "apiqd r");
    EXPECT_EQ(model_.projects().size(), 3u);
}

TEST_F(DashboardTest, TabSavesFieldAndEscCancelsRest) {
    dashboard_.handle_key("down");
    dashboard_.handle_key("e");
    press("2");
    dashboard_.handle_key("tab");
    EXPECT_EQ(dashboard_.edit_session().field(), ProjectField::Path);
    press("/x");
    dashboard_.handle_key("esc");

    EXPECT_FALSE(dashboard_.editing());
    EXPECT_EQ(model_.projects()[1].name, "api2");
    EXPECT_EQ(model_.projects()[1].path, "/srv/api");
}

TEST_F(DashboardTest, EditOnHeaderIsIgnored) {
    dashboard_.handle_key("e");
    EXPECT_FALSE(dashboard_.editing());
}

TEST_F(DashboardTest, DeleteSelected) {
    press("jj");
    dashboard_.handle_key("d");

    ASSERT_EQ(model_.projects().size(), 2u);
    EXPECT_EQ(model_.projects()[0].name, "api");
    EXPECT_EQ(status().message, "Deleted web");
    EXPECT_EQ(store_.stored.size(), 2u);

    dashboard_.handle_key("g");
    dashboard_.handle_key("delete");  // Header row
    EXPECT_EQ(model_.projects().size(), 2u);
}

TEST_F(DashboardTest, DeletingLastRowClampsCursor) {
    dashboard_.handle_key("G");
    dashboard_.handle_key("d");
    EXPECT_EQ(cursor(), 2);
    EXPECT_EQ(dashboard_.view_model().project_table.rows.size(), 3u);
}

TEST_F(DashboardTest, ReloadPicksUpExternalChanges) {
    store_.stored.push_back(make_project("extra", "/e", "x", "apps"));
    dashboard_.handle_key("r");

    EXPECT_EQ(model_.projects().size(), 4u);
    EXPECT_EQ(dashboard_.view_model().project_table.rows.size(), 6u);
    EXPECT_EQ(status().message, "Refreshed");
}

TEST_F(DashboardTest, ColumnScrollingUpdatesHints) {
    dashboard_.handle_resize(100, 30);
    const auto& table = dashboard_.view_model().project_table;
    EXPECT_FALSE(table.all_columns_visible);
    EXPECT_FALSE(table.can_scroll_left);
    EXPECT_TRUE(table.can_scroll_right);

    dashboard_.handle_key("right");
    EXPECT_TRUE(table.can_scroll_left);
    EXPECT_EQ(table.columns.front().field, ProjectField::Path);

    dashboard_.handle_key("left");
    EXPECT_EQ(table.columns.front().field, ProjectField::Name);
}

TEST_F(DashboardTest, QuitKeys) {
    EXPECT_FALSE(dashboard_.handle_key("q"));
    EXPECT_FALSE(dashboard_.running());
}

TEST_F(DashboardTest, CtrlCQuits) {
    EXPECT_FALSE(dashboard_.handle_key("ctrl+c"));
}

TEST(DashboardEmptyTest, EmptyCatalogIgnoresRecordKeys) {
    MemoryProjectStore store;
    RecordingSpawner spawner;
    DisplayModel model(&store);
    Launcher launcher(&spawner);
    Dashboard dashboard(&model, &launcher);
    dashboard.start();

    EXPECT_FALSE(dashboard.view_model().has_projects);
    for (const char* key : {"enter", " ", "e", "d", "o", "down", "G"}) {
        EXPECT_TRUE(dashboard.handle_key(key));
    }
    EXPECT_FALSE(dashboard.editing());
    EXPECT_TRUE(spawner.requests.empty());
    EXPECT_EQ(store.save_count, 0);
    EXPECT_EQ(dashboard.view_model().project_table.cursor, 0);
}
