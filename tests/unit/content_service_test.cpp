#include <cassert>
#include <iostream>

#include "internal/service/access_service.hpp"
#include "internal/service/content_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/registry_fixture.hpp"

namespace {

using registry::testing::kAdmin;
using registry::testing::kT0;
using registry::testing::RegistryFixture;
using registry::testing::Throws;
using namespace registry::v1;

void AddName(RegistryFixture& fx, const std::string& name, const std::string& owner) {
  registry::core::AdminNameRequest request;
  request.name  = name;
  request.owner = owner;
  fx.orchestrator->AdminAddName(kAdmin, request);
}

SaveMetadataRequest Metadata(const std::string& name, const std::string& title) {
  SaveMetadataRequest req;
  req.set_name(name);
  req.set_title(title);
  req.set_description("a registered name");
  req.set_image("https://example.invalid/logo.png");
  return req;
}

void TestOwnerSavesMetadataAndTouchesName() {
  RegistryFixture                  fx;
  registry::service::ContentService content(fx.Context());
  AddName(fx, "alpha", "alice");

  fx.clock->store(kT0 + 1000);
  content.SaveMetadata("alice", Metadata("alpha", "first"));

  ContentNameRequest get;
  get.set_name("alpha");
  auto metadata = content.GetMetadata("anyone", get);
  assert(metadata.title() == "first");
  assert(metadata.created_at() == kT0 + 1000);
  assert(fx.names->Get("alpha").updated_at == kT0 + 1000);

  // a second save keeps created_at
  fx.clock->store(kT0 + 2000);
  content.SaveMetadata("alice", Metadata("alpha", "second"));
  metadata = content.GetMetadata("anyone", get);
  assert(metadata.title() == "second");
  assert(metadata.created_at() == kT0 + 1000);
  assert(metadata.updated_at() == kT0 + 2000);
}

void TestOnlyOwnerOrAdminMayWrite() {
  RegistryFixture                  fx;
  registry::service::ContentService content(fx.Context());
  AddName(fx, "alpha", "alice");
  fx.AddUser("bob");

  assert(Throws<registry::util::Unauthorized>([&] { content.SaveMetadata("bob", Metadata("alpha", "hijack")); }));
  assert(Throws<registry::util::Unauthorized>([&] { content.SaveMetadata("", Metadata("alpha", "hijack")); }));

  SaveMarkdownRequest markdown;
  markdown.set_name("alpha");
  markdown.set_content("# alpha");
  assert(Throws<registry::util::Unauthorized>([&] { content.SaveMarkdown("bob", markdown); }));

  content.SaveMarkdown(kAdmin, markdown);
  ContentNameRequest get;
  get.set_name("alpha");
  assert(content.GetMarkdown("bob", get).content() == "# alpha");
}

void TestUnknownNamesAreNotFound() {
  RegistryFixture                  fx;
  registry::service::ContentService content(fx.Context());
  AddName(fx, "alpha", "alice");

  assert(Throws<registry::util::NotFound>([&] { content.SaveMetadata(kAdmin, Metadata("missing", "x")); }));

  ContentNameRequest get;
  get.set_name("alpha");
  // registered but nothing saved yet
  assert(Throws<registry::util::NotFound>([&] { content.GetMetadata("alice", get); }));
  assert(Throws<registry::util::NotFound>([&] { content.GetMarkdown("alice", get); }));
}

void TestProfiles() {
  RegistryFixture                 fx;
  registry::service::AccessService access(fx.Context());
  fx.AddUser("alice");

  SaveProfileRequest save;
  save.mutable_profile()->set_name("Alice");
  access.SaveCallerProfile("alice", save);
  assert(Throws<registry::util::Unauthorized>([&] { access.SaveCallerProfile("guest", save); }));

  assert(access.GetCallerProfile("alice").profile().name() == "Alice");
  assert(!access.GetCallerProfile("guest").found());
  assert(!access.GetCallerProfile("").found());

  GetProfileRequest get;
  get.set_principal("alice");
  assert(access.GetUserProfile("alice", get).found());
  assert(access.GetUserProfile(kAdmin, get).profile().name() == "Alice");
  assert(Throws<registry::util::Unauthorized>([&] { access.GetUserProfile("bob", get); }));
}

} // namespace

int main() {
  TestOwnerSavesMetadataAndTouchesName();
  TestOnlyOwnerOrAdminMayWrite();
  TestUnknownNamesAreNotFound();
  TestProfiles();

  std::cout << "name_registry_unit_content_service: pass\n";
  return 0;
}
