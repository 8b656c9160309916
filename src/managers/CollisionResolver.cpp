/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CollisionResolver.hpp"
#include "core/Logger.hpp"
#include "events/EventBus.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/ResourceLedger.hpp"

#include <format>
#include <utility>

namespace KeeperEngine {

struct CollisionResolver::TickState {
    EntityRegistry& registry;
    ResourceLedger& ledger;
    EventBus& events;
    ResolutionReport& report;
    boost::container::flat_set<EntityID> consumed;
    boost::container::flat_set<OverlapPair> contacts;
};

CollisionResolver::CollisionResolver(InteractionTable table, float wallContactDamage)
    : m_table(std::move(table)), m_wallContactDamage(wallContactDamage) {
    m_table.validate();
}

void CollisionResolver::destroy(EntityRecord& record, TickState& state) {
    if (!state.registry.despawn(record.id)) {
        return;
    }
    state.consumed.insert(record.id);
    state.report.destroyed.push_back(record.id);

    SimulationEvent event;
    event.type = SimulationEventType::EntityDestroyed;
    event.entity = record.id;
    event.role = record.role;
    event.position = record.position;
    state.events.publish(std::move(event));
}

void CollisionResolver::applyShipDamage(EntityRecord& ship, const EntityRecord& source,
                                        float amount, TickState& state) {
    if (amount <= 0.0f) {
        return;
    }
    ShipDamageResult damage = state.ledger.applyShipDamage(amount);
    state.report.shipDamaged = true;

    SimulationEvent event;
    event.type = SimulationEventType::ShipDamaged;
    event.entity = ship.id;
    event.role = source.role;
    event.position = ship.position;
    event.amount = amount;
    state.events.publish(std::move(event));

    COLLISION_DEBUG(std::format("Ship hit by {} #{} for {:.1f} (shield took {:.1f}, dark matter {:.1f})",
                                RoleTraits::roleToString(source.role), source.id, amount,
                                damage.absorbed, damage.debit.removed));

    if (damage.lethal) {
        state.report.lethalHit = true;
        COLLISION_INFO(std::format("Lethal hit on ship #{} by {} #{}", ship.id,
                                   RoleTraits::roleToString(source.role), source.id));
        destroy(ship, state);
    }
}

ResolutionReport CollisionResolver::resolve(EntityRegistry& registry, ResourceLedger& ledger,
                                            EventBus& events) {
    ResolutionReport report;
    TickState state{registry, ledger, events, report, {}, {}};

    // Snapshot before any effect moves or removes anything
    const std::vector<OverlapPair> pairs = registry.queryOverlaps();
    report.pairsExamined = pairs.size();

    for (const OverlapPair& pair : pairs) {
        if (state.consumed.count(pair.lower) > 0 || state.consumed.count(pair.higher) > 0) {
            ++report.pairsSkipped;
            continue;
        }
        EntityRecord* first = registry.find(pair.lower);
        EntityRecord* second = registry.find(pair.higher);
        if (!first || !second || !first->alive || !second->alive) {
            ++report.pairsSkipped;
            continue;
        }

        CollisionRole firstRole = first->collisionRole();
        CollisionRole secondRole = second->collisionRole();
        InteractionEffect effect = m_table.lookup(firstRole, secondRole);
        if (effect == InteractionEffect::None) {
            continue;
        }

        // Orient so 'b' is the party that gets consumed: 'a' is the ship, the hazard
        // for hazard hits, or the wall for wall impacts
        EntityRecord* a = first;
        EntityRecord* b = second;
        bool firstIsPrimary = false;
        switch (effect) {
            case InteractionEffect::HazardProjectileHit:
                firstIsPrimary = (firstRole == CollisionRole::Hazard);
                break;
            case InteractionEffect::ProjectileWallImpact:
                firstIsPrimary = (firstRole == CollisionRole::Wall);
                break;
            default:
                firstIsPrimary = (firstRole == CollisionRole::Ship);
                break;
        }
        if (!firstIsPrimary) {
            std::swap(a, b);
        }

        switch (effect) {
            case InteractionEffect::ShipHazardContact: {
                const auto* hazard = b->payloadAs<HazardPayload>();
                if (!hazard) {
                    break;
                }
                if (!hazard->destroyedOnContact) {
                    state.contacts.insert(pair);
                    if (m_previousContacts.count(pair) > 0) {
                        ++report.pairsSkipped;
                        break;
                    }
                }
                applyShipDamage(*a, *b, hazard->contactDamage, state);
                if (hazard->destroyedOnContact) {
                    destroy(*b, state);
                }
                ++report.effectsApplied;
                break;
            }
            case InteractionEffect::ShipProjectileHit: {
                const auto* projectile = b->payloadAs<ProjectilePayload>();
                if (!projectile || projectile->ownerId == a->id) {
                    break;
                }
                float damage = projectile->damage;
                destroy(*b, state);
                applyShipDamage(*a, *b, damage, state);
                ++report.effectsApplied;
                break;
            }
            case InteractionEffect::ShipDarkMatterCredit:
            case InteractionEffect::ShipDarkMatterDrain: {
                const auto* pickup = b->payloadAs<PickupPayload>();
                if (!pickup) {
                    break;
                }
                if (effect == InteractionEffect::ShipDarkMatterCredit) {
                    float added = ledger.credit(pickup->amount);
                    COLLISION_DEBUG(std::format("Pickup #{} credited {:.1f} dark matter", b->id, added));
                } else {
                    DebitResult drained = ledger.debit(pickup->amount, DebitReason::RedPickup);
                    COLLISION_DEBUG(std::format("Pickup #{} drained {:.1f} dark matter", b->id,
                                                drained.removed));
                }
                destroy(*b, state);
                ++report.effectsApplied;
                break;
            }
            case InteractionEffect::ShipWallContact: {
                report.shipWallContacts.push_back(b->id);
                state.contacts.insert(pair);

                a->position += a->bounds().minimumTranslation(b->bounds());

                if (m_previousContacts.count(pair) > 0) {
                    ++report.pairsSkipped;
                    break;
                }
                applyShipDamage(*a, *b, m_wallContactDamage, state);
                ++report.effectsApplied;
                break;
            }
            case InteractionEffect::HazardProjectileHit: {
                auto* hazard = a->payloadAs<HazardPayload>();
                const auto* projectile = b->payloadAs<ProjectilePayload>();
                if (!hazard || !projectile || projectile->ownerId == a->id) {
                    break;
                }
                hazard->health -= projectile->damage;
                destroy(*b, state);
                if (hazard->health <= 0.0f) {
                    destroy(*a, state);
                }
                ++report.effectsApplied;
                break;
            }
            case InteractionEffect::ProjectileWallImpact:
                destroy(*b, state);
                ++report.effectsApplied;
                break;
            default:
                break;
        }
    }

    m_previousContacts = std::move(state.contacts);
    return report;
}

} // namespace KeeperEngine
