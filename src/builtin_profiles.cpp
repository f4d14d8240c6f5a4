#include "registry.h"

namespace forcegen {

char const *const kBuiltinProfiles{ R"lua(
-- Package-manager families. Every category inherits
--   unneeded_fail = "false", unneeded_win = "true"
-- from the baseline.
CATEGORIES = {
  rhel7 = {
    config = "rhel7",
    prep_run = "yum install -y epel-release",
    needs = {
      fake_needed = "yum install -y ed",
      needed = "yum install -y openssh",
    },
  },
  rhel8 = {
    config = "rhel8",
    prep_run = "dnf install -y --setopt=install_weak_deps=false epel-release",
    needs = {
      fake_needed = "dnf install -y ed",
      needed = "dnf install -y openssh",
    },
  },
  fedora = {
    config = "fedora",
    needs = {
      fake_needed = "dnf install -y ed",
      needed = "dnf install -y openssh",
    },
  },
  debderiv = {
    config = "debderiv",
    needs = {
      fake_needed = "apt-get update && apt-get install -y git",
      needed = "apt-get update && apt-get install -y openssh-client",
    },
  },
  suse = {
    config = "suse",
    needs = {
      fake_needed = "zypper install -y ed",
      needed = "zypper install -y dbus-1",
    },
  },
  arch = {
    config = "arch",
    needs = {
      fake_needed = "pacman -Syq --noconfirm ed",
      needed = "pacman -Syq --noconfirm dbus",
    },
  },
  alpine = {
    config = "alpine",
    needs = {
      fake_needed = "apk add ed",
      needed = "apk add dbus",
    },
  },
}

HOOKS = {
  epel = {
    description = "EPEL installed by preparation or by --force",
    outputs = { "(Updating|Installing).+: epel-release" },
    files = { { pattern = "enabled=1", path = "/etc/yum.repos.d/epel*.repo" } },
  },
}

-- Declaration order is the order of generated tests.
PROFILES = {
  { name = "centos_7", category = "rhel7", base = "centos:7",
    scope = "standard", hook = "epel" },
  { name = "centos_8", category = "rhel8", base = "centos:8", hook = "epel" },
  { name = "almalinux_8", category = "rhel8", base = "almalinux:8", hook = "epel" },
  { name = "rockylinux_8", category = "rhel8", base = "rockylinux:8", hook = "epel" },

  { name = "fedora_26", category = "fedora", base = "fedora:26" },
  { name = "fedora_34", category = "fedora", base = "fedora:34" },
  { name = "fedora_rawhide", category = "fedora", base = "fedora:rawhide" },

  { name = "debian_9", category = "debderiv", base = "debian:stretch",
    needs = { fake_needed = "apt-get update && apt-get install -y ed" } },
  { name = "debian_10", category = "debderiv", base = "debian:buster",
    scope = "standard" },
  { name = "debian_11", category = "debderiv", base = "debian:bullseye" },
  { name = "ubuntu_16", category = "debderiv", base = "ubuntu:16.04",
    needs = { fake_needed = false } },
  { name = "ubuntu_18", category = "debderiv", base = "ubuntu:18.04" },
  { name = "ubuntu_20", category = "debderiv", base = "ubuntu:20.04" },

  { name = "opensuse_15.3", category = "suse", base = "opensuse/leap:15.3" },

  { name = "archlinux", category = "arch", base = "archlinux:latest",
    arch_excludes = { "aarch64", "ppc64le" } },

  { name = "alpine_3.9", category = "alpine", base = "alpine:3.9" },
  { name = "alpine_3.14", category = "alpine", base = "alpine:3.14",
    scope = "standard" },
  { name = "alpine_edge", category = "alpine", base = "alpine:edge" },
}
)lua" };

}  // namespace forcegen
