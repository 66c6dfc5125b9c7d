#include "admin_service.hpp"

#include <map>
#include <set>

#include "internal/access/access_control.hpp"
#include "internal/core/state_store.hpp"
#include "observe_rpc.hpp"
#include "record_convert.hpp"

namespace registry::service {

using namespace registry::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const std::string& caller) {
  return ObserveRpc("AdminService.Stats", caller, [&] {
    const auto now = ctx_.now();
    return ctx_.store->Read([&](db::Transaction& tx) {
      ctx_.access->Require(tx, caller, USER_ROLE_ADMIN);
      auto& repo = ctx_.store->Repo();

      StatsResponse resp;
      for (const auto& season : repo.ListSeasons(tx)) {
        resp.set_total_seasons(resp.total_seasons() + 1);
        switch (season.status) {
          case SEASON_STATUS_DRAFT:
            resp.set_draft_seasons(resp.draft_seasons() + 1);
            break;
          case SEASON_STATUS_ACTIVE:
            resp.set_active_seasons(resp.active_seasons() + 1);
            break;
          case SEASON_STATUS_ENDED:
            resp.set_ended_seasons(resp.ended_seasons() + 1);
            break;
          case SEASON_STATUS_CANCELLED:
            resp.set_cancelled_seasons(resp.cancelled_seasons() + 1);
            break;
          default:
            break;
        }
      }

      resp.set_total_names(repo.ListNames(tx).size());

      for (const auto& payment : repo.ListPayments(tx)) {
        resp.set_total_payments(resp.total_payments() + 1);
        resp.set_total_revenue(resp.total_revenue() + payment.amount);
      }

      for (const auto& subscription : repo.ListSubscriptions(tx)) {
        resp.set_total_subscriptions(resp.total_subscriptions() + 1);
        if (subscription.is_active && now < subscription.end_time) {
          resp.set_active_subscriptions(resp.active_subscriptions() + 1);
        }
      }
      return resp;
    });
  });
}

ListPaymentsResponse AdminService::ListPayments(const std::string& caller) {
  return ObserveRpc("AdminService.ListPayments", caller, [&] {
    return ctx_.store->Read([&](db::Transaction& tx) {
      ctx_.access->Require(tx, caller, USER_ROLE_ADMIN);

      ListPaymentsResponse resp;
      for (const auto& payment : ctx_.store->Repo().ListPayments(tx)) {
        *resp.add_payments() = ToProto(payment);
      }
      return resp;
    });
  });
}

void AdminService::PauseAllSubscriptions(const std::string& caller) {
  ObserveRpc("AdminService.PauseAllSubscriptions", caller, [&] {
    ctx_.store->Write([&](db::Transaction& tx) {
      ctx_.access->Require(tx, caller, USER_ROLE_ADMIN);
      core::ThrowIfDbError(ctx_.store->Repo().DeactivateAllSubscriptions(tx), "deactivate subscriptions");
    });
    REGISTRY_LOG_INFO("Subscriptions paused", {registry::observability::StringField("caller", caller)});
  });
}

ValidateSystemStateResponse AdminService::ValidateSystemState(const std::string& caller) {
  return ObserveRpc("AdminService.ValidateSystemState", caller, [&] {
    return ctx_.store->Read([&](db::Transaction& tx) {
      ctx_.access->Require(tx, caller, USER_ROLE_ADMIN);
      auto& repo = ctx_.store->Repo();

      ValidateSystemStateResponse resp;
      auto issue = [&resp](const std::string& text) { resp.add_issues(text); };

      std::set<uint64_t> season_ids;
      uint64_t           active = 0;
      for (const auto& season : repo.ListSeasons(tx)) {
        season_ids.insert(season.id);
        if (season.status == SEASON_STATUS_ACTIVE) ++active;
      }
      if (active > 1) {
        issue(std::to_string(active) + " seasons are active");
      }

      std::map<std::string, std::string> owners;
      for (const auto& name : repo.ListNames(tx)) {
        auto [it, inserted] = owners.emplace(name.owner, name.name);
        if (!inserted) {
          issue("owner " + name.owner + " holds " + it->second + " and " + name.name);
        }
        if (name.season_id != 0 && !season_ids.contains(name.season_id)) {
          issue("name " + name.name + " references missing season " + std::to_string(name.season_id));
        }
      }

      std::set<uint64_t> consumed;
      for (auto block : repo.ListConsumedBlocks(tx)) {
        consumed.insert(block);
      }

      std::set<uint64_t> payment_ids;
      std::set<uint64_t> payment_blocks;
      for (const auto& payment : repo.ListPayments(tx)) {
        payment_ids.insert(payment.id);
        if (!payment_blocks.insert(payment.block_index).second) {
          issue("block " + std::to_string(payment.block_index) + " funds more than one payment");
        }
        if (!consumed.contains(payment.block_index)) {
          issue("payment " + std::to_string(payment.id) + " uses unconsumed block " + std::to_string(payment.block_index));
        }
      }

      for (const auto& subscription : repo.ListSubscriptions(tx)) {
        if (!payment_ids.contains(subscription.payment_id)) {
          issue("subscription of " + subscription.user + " references missing payment " + std::to_string(subscription.payment_id));
        }
      }

      resp.set_valid(resp.issues_size() == 0);
      if (!resp.valid()) {
        REGISTRY_LOG_WARN("System state has issues", {registry::observability::IntField("issues", resp.issues_size())});
      }
      return resp;
    });
  });
}

} // namespace registry::service
