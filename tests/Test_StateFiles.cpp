#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/registry.hpp>

import Core;
import ECS;
import Persistence;

using namespace ECS::Components;

namespace
{
    Transform::Component MakePose()
    {
        Transform::Component t;
        t.Position = glm::vec3(4.0f, 3.5f, -2.0f);
        t.Rotation.x = -0.1f;
        t.Rotation.y = 0.7f;
        t.Rotation.z = 0.4f;
        t.Rotation.w = 0.6f;
        t.Scale = glm::vec3(12.6f, -1.0f, 2.4f);
        return t;
    }

    std::string ReadFile(const std::filesystem::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    void WriteFile(const std::filesystem::path& path, const std::string& text)
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << text;
    }
}

// Each test gets its own scratch directory under the system temp path.
class StateFilesTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_Root = std::filesystem::temp_directory_path() /
                 (std::string("whereabouts_") + info->test_suite_name() + "_" + info->name());

        std::error_code ec;
        std::filesystem::remove_all(m_Root, ec);
        m_Config.Directory = m_Root / "saves";
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_Root, ec);
    }

    entt::entity SpawnTracked(const std::string& name, const Transform::Component& transform = {})
    {
        entt::entity e = m_Scene.CreateEntity(name);
        m_Scene.GetRegistry().get<Transform::Component>(e) = transform;
        Persistence::Track(m_Scene.GetRegistry(), e, name);
        return e;
    }

    std::filesystem::path m_Root;
    Persistence::Config m_Config;
    ECS::Scene m_Scene;
};

// -----------------------------------------------------------------------------
// Paths
// -----------------------------------------------------------------------------

TEST(StateFiles, DefaultDirectory)
{
    Persistence::Config config;
    EXPECT_EQ(config.Directory, std::filesystem::path("./assets/saves"));
}

TEST(StateFiles, StatePathAppendsExtension)
{
    Persistence::Config config;
    config.Directory = "saves/level1";

    EXPECT_EQ(Persistence::StatePath(config, "camera"), std::filesystem::path("saves/level1/camera.state"));
}

TEST(StateFiles, OpenMissingFile)
{
    auto lines = Persistence::OpenStateFile("/nonexistent/path/to/camera.state");
    ASSERT_FALSE(lines.has_value());
    EXPECT_EQ(lines.error(), Core::ErrorCode::FileNotFound);
}

// -----------------------------------------------------------------------------
// Track
// -----------------------------------------------------------------------------

TEST(StateFiles, TrackAddsIdentityTransformWhenMissing)
{
    entt::registry registry;
    entt::entity e = registry.create();

    Persistence::Track(registry, e, "lamp");

    ASSERT_TRUE((registry.all_of<SavedTransform::Component, Transform::Component>(e)));
    EXPECT_EQ(registry.get<SavedTransform::Component>(e).Name, "lamp");
    EXPECT_EQ(registry.get<Transform::Component>(e), Transform::Component{});
}

TEST(StateFiles, TrackKeepsExistingTransform)
{
    entt::registry registry;
    entt::entity e = registry.create();
    registry.emplace<Transform::Component>(e, MakePose());

    Persistence::Track(registry, e, "lamp");

    EXPECT_EQ(registry.get<Transform::Component>(e), MakePose());
}

// -----------------------------------------------------------------------------
// Save / Load
// -----------------------------------------------------------------------------

TEST_F(StateFilesTest, SaveCreatesDirectoryAndFile)
{
    SpawnTracked("system_save_test", MakePose());

    auto saved = Persistence::SaveState(m_Scene.GetRegistry(), m_Config);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(*saved, 1u);

    const auto path = m_Config.Directory / "system_save_test.state";
    ASSERT_TRUE(std::filesystem::exists(path));

    std::istringstream stream(ReadFile(path));
    Persistence::StreamLineSource lines(stream);
    auto decoded = Persistence::DeserializeTransform(lines);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().Message;
    EXPECT_EQ(*decoded, MakePose());
}

TEST_F(StateFilesTest, SaveWithNothingTrackedWritesNothing)
{
    m_Scene.CreateEntity("untracked");

    auto saved = Persistence::SaveState(m_Scene.GetRegistry(), m_Config);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(*saved, 0u);
    EXPECT_FALSE(std::filesystem::exists(m_Config.Directory));
}

TEST_F(StateFilesTest, SaveTruncatesPreviousFile)
{
    std::filesystem::create_directories(m_Config.Directory);
    WriteFile(m_Config.Directory / "camera.state", std::string(4096, 'x'));

    SpawnTracked("camera");

    ASSERT_TRUE(Persistence::SaveState(m_Scene.GetRegistry(), m_Config).has_value());

    Persistence::BufferByteSink expected;
    ASSERT_TRUE(Persistence::SerializeTransform(expected, Transform::Component{}).has_value());
    EXPECT_EQ(ReadFile(m_Config.Directory / "camera.state"), expected.ToString());
}

TEST_F(StateFilesTest, SaveIntoFileInsteadOfDirectoryFails)
{
    std::filesystem::create_directories(m_Root);
    WriteFile(m_Config.Directory, "not a directory");

    SpawnTracked("camera");

    auto saved = Persistence::SaveState(m_Scene.GetRegistry(), m_Config);
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error(), Core::ErrorCode::InvalidPath);
}

TEST_F(StateFilesTest, SaveThenLoadRestoresEveryTrackedEntity)
{
    Transform::Component second = MakePose();
    second.Position = glm::vec3(-7.0f, 0.25f, 1e-3f);

    SpawnTracked("first", MakePose());
    SpawnTracked("second", second);
    ASSERT_EQ(Persistence::SaveState(m_Scene.GetRegistry(), m_Config).value(), 2u);

    ECS::Scene restored;
    auto& reg = restored.GetRegistry();
    entt::entity a = restored.CreateEntity("first");
    entt::entity b = restored.CreateEntity("second");
    reg.emplace<SavedTransform::Component>(a, SavedTransform::Component::FromName("first"));
    reg.emplace<SavedTransform::Component>(b, SavedTransform::Component::FromName("second"));

    EXPECT_EQ(Persistence::LoadState(reg, m_Config), 2u);
    EXPECT_EQ(reg.get<Transform::Component>(a), MakePose());
    EXPECT_EQ(reg.get<Transform::Component>(b), second);
    EXPECT_TRUE(reg.all_of<Transform::IsDirtyTag>(a));
    EXPECT_TRUE(reg.all_of<Transform::IsDirtyTag>(b));
}

TEST_F(StateFilesTest, SavedTransformOnBareEntityIsPersisted)
{
    auto& reg = m_Scene.GetRegistry();
    entt::entity e = reg.create();
    reg.emplace<SavedTransform::Component>(e, SavedTransform::Component::FromName("bare"));
    reg.get<Transform::Component>(e) = MakePose();

    ASSERT_EQ(Persistence::SaveState(reg, m_Config).value(), 1u);
    EXPECT_TRUE(std::filesystem::exists(m_Config.Directory / "bare.state"));

    ECS::Scene restored;
    auto& restoredReg = restored.GetRegistry();
    entt::entity r = restoredReg.create();
    restoredReg.emplace<SavedTransform::Component>(r, SavedTransform::Component::FromName("bare"));

    EXPECT_EQ(Persistence::LoadState(restoredReg, m_Config), 1u);
    EXPECT_EQ(restoredReg.get<Transform::Component>(r), MakePose());
}

TEST_F(StateFilesTest, LoadWithoutFileKeepsDefault)
{
    entt::entity e = SpawnTracked("never_saved", MakePose());

    EXPECT_EQ(Persistence::LoadState(m_Scene.GetRegistry(), m_Config), 0u);
    EXPECT_EQ(m_Scene.GetRegistry().get<Transform::Component>(e), MakePose());
    EXPECT_FALSE(m_Scene.GetRegistry().all_of<Transform::IsDirtyTag>(e));
}

TEST_F(StateFilesTest, LoadCorruptFileKeepsDefault)
{
    std::filesystem::create_directories(m_Config.Directory);
    WriteFile(m_Config.Directory / "camera.state", "v2\n\ntranslation:\n1\n2\n3\n");

    entt::entity e = SpawnTracked("camera");

    EXPECT_EQ(Persistence::LoadState(m_Scene.GetRegistry(), m_Config), 0u);
    EXPECT_EQ(m_Scene.GetRegistry().get<Transform::Component>(e), Transform::Component{});
}

TEST_F(StateFilesTest, LoadIgnoresUntrackedEntities)
{
    std::filesystem::create_directories(m_Config.Directory);
    Persistence::BufferByteSink sink;
    ASSERT_TRUE(Persistence::SerializeTransform(sink, MakePose()).has_value());
    WriteFile(m_Config.Directory / "prop.state", sink.ToString());

    entt::entity e = m_Scene.CreateEntity("prop");

    EXPECT_EQ(Persistence::LoadState(m_Scene.GetRegistry(), m_Config), 0u);
    EXPECT_EQ(m_Scene.GetRegistry().get<Transform::Component>(e), Transform::Component{});
}

TEST(StateFiles, LoadCheckedInCameraState)
{
    Persistence::Config config;
    config.Directory = std::filesystem::path(WHEREABOUTS_ROOT_DIR) / "assets" / "tests";

    ECS::Scene scene;
    auto& reg = scene.GetRegistry();
    entt::entity camera = scene.CreateEntity("Main Camera");
    reg.emplace<SavedTransform::Component>(camera, SavedTransform::Component::Camera());

    ASSERT_EQ(Persistence::LoadState(reg, config), 1u);

    const auto& t = reg.get<Transform::Component>(camera);
    EXPECT_EQ(t.Position, glm::vec3(10.000002f, 10.0f, 10.0f));
    EXPECT_EQ(t.Rotation.x, -0.27984813f);
    EXPECT_EQ(t.Rotation.y, 0.36470526f);
    EXPECT_EQ(t.Rotation.z, 0.11591691f);
    EXPECT_EQ(t.Rotation.w, 0.88047624f);
    EXPECT_EQ(t.Scale, glm::vec3(1.0f));

    // Re-encoding reproduces the checked-in bytes.
    Persistence::BufferByteSink sink;
    ASSERT_TRUE(Persistence::SerializeTransform(sink, t).has_value());
    EXPECT_EQ(sink.ToString(), ReadFile(config.Directory / "camera.state"));
}

// -----------------------------------------------------------------------------
// TransformPersistence (lifecycle hooks)
// -----------------------------------------------------------------------------

TEST_F(StateFilesTest, PersistenceSavesOnlyOnWindowClose)
{
    SpawnTracked("camera", MakePose());
    Persistence::TransformPersistence persistence(m_Config);

    std::vector<Core::Windowing::Event> frame{Core::Windowing::WindowResizeEvent{800, 600}};
    auto quiet = persistence.OnUpdate(m_Scene.GetRegistry(), frame);
    ASSERT_TRUE(quiet.has_value());
    EXPECT_EQ(*quiet, 0u);
    EXPECT_FALSE(std::filesystem::exists(m_Config.Directory / "camera.state"));

    frame.push_back(Core::Windowing::WindowCloseEvent{322});
    auto closing = persistence.OnUpdate(m_Scene.GetRegistry(), frame);
    ASSERT_TRUE(closing.has_value());
    EXPECT_EQ(*closing, 1u);
    EXPECT_TRUE(std::filesystem::exists(m_Config.Directory / "camera.state"));
}

TEST_F(StateFilesTest, PersistenceLoadsOnlyOnFirstStart)
{
    SpawnTracked("camera", MakePose());
    Persistence::TransformPersistence writer(m_Config);
    std::vector<Core::Windowing::Event> close{Core::Windowing::WindowCloseEvent{}};
    ASSERT_EQ(writer.OnUpdate(m_Scene.GetRegistry(), close).value(), 1u);

    ECS::Scene next;
    entt::entity camera = next.CreateEntity("camera");
    Persistence::Track(next.GetRegistry(), camera, "camera");

    Persistence::TransformPersistence reader(m_Config);
    EXPECT_FALSE(reader.HasStarted());
    EXPECT_EQ(reader.OnStart(next.GetRegistry()), 1u);
    EXPECT_TRUE(reader.HasStarted());
    EXPECT_EQ(next.GetRegistry().get<Transform::Component>(camera), MakePose());

    // A second start must not overwrite what the application changed since.
    next.GetRegistry().get<Transform::Component>(camera).Position = glm::vec3(0.0f);
    EXPECT_EQ(reader.OnStart(next.GetRegistry()), 0u);
    EXPECT_EQ(next.GetRegistry().get<Transform::Component>(camera).Position, glm::vec3(0.0f));
}

TEST_F(StateFilesTest, PersistenceReportsSaveFailure)
{
    std::filesystem::create_directories(m_Root);
    WriteFile(m_Config.Directory, "not a directory");
    SpawnTracked("camera");

    Persistence::TransformPersistence persistence(m_Config);
    std::vector<Core::Windowing::Event> close{Core::Windowing::WindowCloseEvent{}};

    auto saved = persistence.OnUpdate(m_Scene.GetRegistry(), close);
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error(), Core::ErrorCode::InvalidPath);
}
