#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/encoder/encoder.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/time.hpp"

namespace slideshow::service {

using namespace slideshow::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthcheckResponse AdminService::Healthcheck(const HealthcheckRequest&) {
  HealthcheckResponse resp;
  resp.set_status("ok");
  *resp.mutable_timestamp() = util::NowProto();
  return resp;
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", 0, [&] {
    auto tx     = ctx_.repository->Begin();
    auto counts = ctx_.repository->CountProjectsByStatus(*tx);
    tx->Commit();

    auto count_of = [&counts](ProjectStatus status) -> uint64_t {
      auto it = counts.find(static_cast<int>(status));
      return it == counts.end() ? 0 : it->second;
    };

    StatsResponse resp;
    resp.set_projects_pending(count_of(PROJECT_STATUS_PENDING));
    resp.set_projects_processing(count_of(PROJECT_STATUS_PROCESSING));
    resp.set_projects_completed(count_of(PROJECT_STATUS_COMPLETED));
    resp.set_projects_failed(count_of(PROJECT_STATUS_FAILED));
    resp.set_encoder_mode(ctx_.encoder ? ctx_.encoder->Mode() : "none");
    return resp;
  });
}

} // namespace slideshow::service
