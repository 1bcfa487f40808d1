/**
 * @file registration.cpp
 * @brief ModelFactory registration for the built-in model library
 *
 * Types are registered at static initialization time when this translation
 * unit is linked into an executable, and again on every RegisterModels()
 * call.
 */

#include <Registration.hpp>

#include <cadence/core/ModelFactory.hpp>

#include <grounds/FlatGround.hpp>
#include <joints/RevoluteJoint.hpp>
#include <joints/WeldJoint.hpp>
#include <legs/TwoPinStickLeg.hpp>
#include <links/RigidLink.hpp>
#include <systems/Pendulum.hpp>
#include <systems/RollingDisc.hpp>
#include <tyres/NonHolonomicTyre.hpp>
#include <wheels/KnifeEdgeWheel.hpp>
#include <wheels/ToroidalWheel.hpp>

namespace cadence {
namespace models {

namespace {

template <typename T> void RegisterModel(ModelFactory &factory, const std::string &type_name) {
    factory.RegisterModel(type_name, T::TypeFamilies(), [](const ModelOptions &options) {
        auto model = std::make_unique<T>(options.name);
        model->SetOptions(options);
        return model;
    });
}

template <typename T>
void RegisterConnection(ModelFactory &factory, const std::string &type_name) {
    factory.RegisterConnection(type_name, T::TypeFamilies(),
                               [](const ModelOptions &options, std::vector<Interface *> interfaces) {
                                   auto connection =
                                       std::make_unique<T>(options.name, std::move(interfaces));
                                   connection->SetOptions(options);
                                   return connection;
                               });
}

} // namespace

void RegisterModels() {
    auto &factory = ModelFactory::Instance();

    // Abstract families
    factory.RegisterAbstract("GroundBase", RequirementKind::Model);
    factory.RegisterAbstract("WheelBase", RequirementKind::Model);
    factory.RegisterAbstract("LegBase", RequirementKind::Model);
    factory.RegisterAbstract("JointBase", RequirementKind::Connection);
    factory.RegisterAbstract("TyreBase", RequirementKind::Connection);

    // Building blocks
    RegisterModel<FlatGround>(factory, "FlatGround");
    RegisterModel<KnifeEdgeWheel>(factory, "KnifeEdgeWheel");
    RegisterModel<ToroidalWheel>(factory, "ToroidalWheel");
    RegisterModel<RigidLink>(factory, "RigidLink");
    RegisterModel<TwoPinStickLeg>(factory, "TwoPinStickLeg");

    // Connections
    RegisterConnection<RevoluteJoint>(factory, "RevoluteJoint");
    RegisterConnection<WeldJoint>(factory, "WeldJoint");
    RegisterConnection<NonHolonomicTyre>(factory, "NonHolonomicTyre");

    // Complete systems
    RegisterModel<RollingDisc>(factory, "RollingDisc");
    RegisterModel<Pendulum>(factory, "Pendulum");
}

} // namespace models
} // namespace cadence

namespace {

const bool registered = []() {
    ::cadence::models::RegisterModels();
    return true;
}();

} // anonymous namespace
