#include <gtest/gtest.h>
#include <managers/pod_manifest.hpp>
#include <managers/run_name_resolver.hpp>
#include "fakes.hpp"
#include <stdexcept>

static LaunchConfig make_launch() {
    LaunchConfig::Fields f;
    f.run_name = "quirky-einstein";
    f.namespace_name = "workflows";
    f.cpus = 2;
    f.memory = "4Gi";
    f.volume_mounts = {"data-pvc:/data", "work-pvc:/mnt/work"};
    return LaunchConfig(f);
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ── parse_volume_mount ──────────────────────────────────────

TEST(PodManifest, ParseVolumeMount) {
    auto [claim, path] = parse_volume_mount("data-pvc:/mnt/data");
    EXPECT_EQ(claim, "data-pvc");
    EXPECT_EQ(path, "/mnt/data");
}

TEST(PodManifest, ParseVolumeMount_Invalid) {
    EXPECT_THROW(parse_volume_mount("data-pvc"), std::invalid_argument);
    EXPECT_THROW(parse_volume_mount(":/mnt"), std::invalid_argument);
    EXPECT_THROW(parse_volume_mount("pvc:"), std::invalid_argument);
}

// ── build_head_command ──────────────────────────────────────

TEST(PodManifest, HeadCommand_Basic) {
    Config config;
    auto cmd = build_head_command("org/repo", {"--reads", "a b"}, make_launch(), config);
    EXPECT_EQ(cmd, "'nextflow' 'run' 'org/repo' '-name' 'quirky-einstein' '--reads' 'a b'");
}

TEST(PodManifest, HeadCommand_RemoteConfigAndProfile) {
    Config config;
    LaunchConfig::Fields f;
    f.run_name = "r1";
    f.remote_config = {"/data/a.config", "/data/b.config"};
    f.remote_profile = "gcp";
    auto cmd = build_head_command("org/repo", {}, LaunchConfig(f), config);
    EXPECT_TRUE(contains(cmd, "'-c' '/data/a.config' '-c' '/data/b.config'"));
    EXPECT_TRUE(contains(cmd, "'-profile' 'gcp'"));
}

TEST(PodManifest, HeadCommand_Prescript) {
    Config config;
    LaunchConfig::Fields f;
    f.run_name = "r1";
    f.prescript = "/scripts/init.sh";
    auto cmd = build_head_command("org/repo", {}, LaunchConfig(f), config);
    EXPECT_EQ(cmd.rfind("/scripts/init.sh && ", 0), 0u);
}

TEST(PodManifest, HeadCommand_StdinScript) {
    Config config;
    LaunchConfig::Fields f;
    f.run_name = "r1";
    auto cmd = build_head_command("-", {}, LaunchConfig(f), config, "workflow { println 'hi' }");
    EXPECT_TRUE(contains(cmd, "<<'KUBERUN_EOF'\nworkflow { println 'hi' }\nKUBERUN_EOF\n"));
    EXPECT_TRUE(contains(cmd, "'run' '/tmp/kuberun-stdin.nf'"));
}

TEST(PodManifest, HeredocMarkerAvoidsScriptLines) {
    EXPECT_EQ(heredoc_marker("workflow {}"), "KUBERUN_EOF");
    EXPECT_EQ(heredoc_marker("a\nKUBERUN_EOF\nb"), "KUBERUN_EOF_1");
    EXPECT_EQ(heredoc_marker("KUBERUN_EOF\r\nKUBERUN_EOF_1\n"), "KUBERUN_EOF_2");
    // Only whole lines end a heredoc
    EXPECT_EQ(heredoc_marker("echo KUBERUN_EOF"), "KUBERUN_EOF");
}

TEST(PodManifest, HeadCommand_StdinScriptContainingMarker) {
    Config config;
    LaunchConfig::Fields f;
    f.run_name = "r1";
    std::string script = "println 'a'\nKUBERUN_EOF\nprintln 'b'";
    auto cmd = build_head_command("-", {}, LaunchConfig(f), config, script);
    EXPECT_TRUE(contains(cmd, "<<'KUBERUN_EOF_1'\n" + script + "\nKUBERUN_EOF_1\n"));
}

// ── build_pod_manifest ──────────────────────────────────────

TEST(PodManifest, Metadata) {
    Config config;
    const YAML::Node pod = build_pod_manifest("org/repo", {}, make_launch(), config);

    EXPECT_EQ(pod["apiVersion"].as<std::string>(), "v1");
    EXPECT_EQ(pod["kind"].as<std::string>(), "Pod");
    EXPECT_EQ(pod["metadata"]["name"].as<std::string>(), "quirky-einstein");
    EXPECT_EQ(pod["metadata"]["namespace"].as<std::string>(), "workflows");
    EXPECT_EQ(pod["metadata"]["labels"]["app"].as<std::string>(), "kuberun");
    EXPECT_EQ(pod["metadata"]["labels"]["runName"].as<std::string>(), "quirky-einstein");
    EXPECT_EQ(pod["spec"]["restartPolicy"].as<std::string>(), "Never");
}

TEST(PodManifest, DefaultImageAndNoNamespace) {
    Config config;
    LaunchConfig::Fields f;
    f.run_name = "r1";
    const YAML::Node pod = build_pod_manifest("org/repo", {}, LaunchConfig(f), config);

    EXPECT_FALSE(pod["metadata"]["namespace"]);
    EXPECT_FALSE(pod["spec"]["volumes"]);
    EXPECT_FALSE(pod["spec"]["serviceAccountName"]);
    const YAML::Node c = pod["spec"]["containers"][0];
    EXPECT_EQ(c["image"].as<std::string>(), config.head().image);
    EXPECT_FALSE(c["resources"]);
}

TEST(PodManifest, ExplicitImage) {
    Config config;
    LaunchConfig::Fields f;
    f.run_name = "r1";
    f.image = "nextflow/nextflow:24.04.0";
    const YAML::Node pod = build_pod_manifest("org/repo", {}, LaunchConfig(f), config);
    EXPECT_EQ(pod["spec"]["containers"][0]["image"].as<std::string>(), "nextflow/nextflow:24.04.0");
}

TEST(PodManifest, ResourcesAndVolumes) {
    Config config;
    const YAML::Node pod = build_pod_manifest("org/repo", {}, make_launch(), config);
    const YAML::Node c = pod["spec"]["containers"][0];

    EXPECT_EQ(c["resources"]["requests"]["cpu"].as<std::string>(), "2");
    EXPECT_EQ(c["resources"]["requests"]["memory"].as<std::string>(), "4Gi");

    ASSERT_EQ(c["volumeMounts"].size(), 2u);
    EXPECT_EQ(c["volumeMounts"][0]["name"].as<std::string>(), "vol-1");
    EXPECT_EQ(c["volumeMounts"][0]["mountPath"].as<std::string>(), "/data");
    EXPECT_EQ(c["volumeMounts"][1]["mountPath"].as<std::string>(), "/mnt/work");

    const YAML::Node vols = pod["spec"]["volumes"];
    ASSERT_EQ(vols.size(), 2u);
    EXPECT_EQ(vols[0]["name"].as<std::string>(), "vol-1");
    EXPECT_EQ(vols[0]["persistentVolumeClaim"]["claimName"].as<std::string>(), "data-pvc");
    EXPECT_EQ(vols[1]["persistentVolumeClaim"]["claimName"].as<std::string>(), "work-pvc");
}

TEST(PodManifest, ContainerCommand) {
    Config config;
    const YAML::Node pod = build_pod_manifest("org/repo", {}, make_launch(), config);
    const YAML::Node cmd = pod["spec"]["containers"][0]["command"];

    ASSERT_EQ(cmd.size(), 3u);
    EXPECT_EQ(cmd[0].as<std::string>(), "/bin/bash");
    EXPECT_EQ(cmd[1].as<std::string>(), "-c");
    EXPECT_TRUE(contains(cmd[2].as<std::string>(), "'run' 'org/repo' '-name' 'quirky-einstein'"));
}

TEST(PodManifest, InvalidVolumeMountThrows) {
    Config config;
    LaunchConfig::Fields f;
    f.run_name = "r1";
    f.volume_mounts = {"no-path"};
    EXPECT_THROW(build_pod_manifest("org/repo", {}, LaunchConfig(f), config), std::invalid_argument);
}

TEST(PodManifest, LabelValueLimit) {
    EXPECT_EQ(label_value("short-name"), "short-name");
    std::string name = "a" + std::string(61, 'b') + "-c";
    ASSERT_EQ(name.size(), 64u);
    // Cut at 63 leaves a trailing '-', which is not a valid label end
    EXPECT_EQ(label_value(name), "a" + std::string(61, 'b'));
}

TEST(PodManifest, LongRunNameFitsClusterLimits) {
    FakeHistory history;
    RunNameResolver resolver(history);
    std::string supplied = "a" + std::string(69, 'b');
    auto resolved = resolver.resolve(supplied, true);
    ASSERT_TRUE(resolved.is_ok()) << resolved.error;

    Config config;
    LaunchConfig::Fields f;
    f.run_name = resolved.value;
    const YAML::Node pod = build_pod_manifest("org/repo", {}, LaunchConfig(f), config);

    EXPECT_EQ(pod["metadata"]["name"].as<std::string>(), supplied);
    const std::string container = pod["spec"]["containers"][0]["name"].as<std::string>();
    const std::string label = pod["metadata"]["labels"]["runName"].as<std::string>();
    EXPECT_EQ(container, "head");
    EXPECT_LE(label.size(), 63u);
    EXPECT_EQ(label, supplied.substr(0, 63));
}
