#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

#include "entity_resolution.h"
#include "fake_http_client.h"

namespace {

RawFacultyRecord janeSmith() {
    RawFacultyRecord r;
    r.name = "Dr. Jane Smith";
    r.title = "Professor";
    r.email = "jsmith@cmu.edu";
    r.phone = "412-268-1000";
    r.office = "Baker Hall 330";
    r.department = "Psychology";
    r.university = "Carnegie Mellon University";
    r.profileUrl = "https://www.cmu.edu/psychology/people/jsmith";
    r.sourceUrl = "https://www.cmu.edu/psychology/people";
    return r;
}

RawFacultyRecord withLab(RawFacultyRecord r, const string& labName, const string& website) {
    r.labName = labName;
    r.labWebsite = website;
    return r;
}

class EntityResolutionTest : public ::testing::Test {
protected:
    EntityResolutionTest() : store(repo, clock.fn()) {}

    string onlyFacultyId() {
        vector<FacultyEntity> found = store.findFacultyByName("Jane Smith");
        EXPECT_EQ(found.size(), 1u);
        return found.empty() ? string() : found.front().id;
    }

    ManualClock clock;
    InMemoryEntityRepository repo;
    EntityResolutionStore store;
};

}

TEST(EntityIds, InstitutionKeyDropsGenericWords) {
    EXPECT_EQ(institutionKey("Carnegie Mellon University"), "carnegie_mellon");
    EXPECT_EQ(institutionKey("Psychology"), "psychology");
}

TEST(EntityIds, AssociationTransitions) {
    EXPECT_TRUE(isAllowedAssociationTransition(AssociationStatus::PendingVerification, AssociationStatus::Verified));
    EXPECT_FALSE(isAllowedAssociationTransition(AssociationStatus::Active, AssociationStatus::Verified));
    EXPECT_TRUE(isAllowedAssociationTransition(AssociationStatus::Verified, AssociationStatus::Disputed));
    EXPECT_FALSE(isAllowedAssociationTransition(AssociationStatus::Disputed, AssociationStatus::Active));
    EXPECT_FALSE(isAllowedAssociationTransition(AssociationStatus::Inactive, AssociationStatus::Inactive));
}

TEST_F(EntityResolutionTest, FirstIngestBuildsGraph) {
    IngestReport report = store.ingest({ janeSmith() }, "scrape_1");
    EXPECT_EQ(report.processed, 1u);
    EXPECT_EQ(report.created, 1u);
    EXPECT_EQ(report.universitiesCreated, 1u);
    EXPECT_EQ(report.departmentsCreated, 1u);
    EXPECT_EQ(report.associationsCreated, 1u);

    FacultyEntity f = store.findFacultyByName("jane smith").at(0);
    EXPECT_EQ(f.name, "Dr. Jane Smith");
    EXPECT_EQ(f.normalizedName, "jane smith");
    EXPECT_EQ(f.primaryUniversityId, "univ_carnegie_mellon");
    EXPECT_EQ(f.primaryDepartmentId, "dept_univ_carnegie_mellon_psychology");
    EXPECT_DOUBLE_EQ(f.confidenceScore, DEFAULT_FACULTY_CONFIDENCE);
    EXPECT_EQ(f.sourceScrapeId, "scrape_1");

    optional<UniversityEntity> u = store.getUniversity("univ_carnegie_mellon");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->domain, "www.cmu.edu");

    optional<ScrapeSession> session = store.getScrapeSession("scrape_1");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->facultyIds, vector<string>{ f.id });
    EXPECT_EQ(session->report["faculty_created"], 1);
}

TEST_F(EntityResolutionTest, ReingestIsIdempotentAndLosesNoFields) {
    store.ingest({ janeSmith() }, "scrape_1");
    RawFacultyRecord sparse;
    sparse.name = "Jane Smith";
    sparse.university = "Carnegie Mellon University";
    sparse.department = "Psychology";
    IngestReport second = store.ingest({ janeSmith(), sparse }, "scrape_2");

    EXPECT_EQ(second.created, 0u);
    EXPECT_EQ(second.merged, 2u);
    EXPECT_EQ(second.associationsCreated, 0u);
    EXPECT_EQ(second.conflicts, 0u);
    EXPECT_EQ(store.facultyCount(), 1u);

    string id = onlyFacultyId();
    optional<FacultyEntity> f = store.getFaculty(id);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->email.value_or(""), "jsmith@cmu.edu");
    EXPECT_EQ(f->phone.value_or(""), "412-268-1000");
    EXPECT_EQ(f->officeLocation.value_or(""), "Baker Hall 330");
    EXPECT_EQ(f->title.value_or(""), "Professor");
    EXPECT_EQ(store.departmentAssociationsOf(id).size(), 1u);
}

TEST_F(EntityResolutionTest, SecondDepartmentBecomesJointAppointment) {
    RawFacultyRecord hci = janeSmith();
    hci.department = "Human-Computer Interaction Institute";
    hci.sourceUrl = "https://hcii.cmu.edu/people";
    IngestReport report = store.ingest({ janeSmith(), hci }, "scrape_1");

    EXPECT_EQ(report.created, 1u);
    EXPECT_EQ(report.merged, 1u);
    EXPECT_EQ(report.departmentsCreated, 2u);
    EXPECT_EQ(store.facultyCount(), 1u);

    string id = onlyFacultyId();
    vector<FacultyDepartmentAssociation> depts = store.departmentAssociationsOf(id);
    ASSERT_EQ(depts.size(), 2u);
    map<string, string> typeByDept;
    for (const auto& a : depts) typeByDept[a.departmentId] = a.appointmentType;
    EXPECT_EQ(typeByDept["dept_univ_carnegie_mellon_psychology"], "primary");
    size_t joint = 0;
    for (const auto& kv : typeByDept) {
        if (kv.second == "joint") ++joint;
    }
    EXPECT_EQ(joint, 1u);
    EXPECT_EQ(store.getFaculty(id)->primaryDepartmentId, "dept_univ_carnegie_mellon_psychology");
}

TEST_F(EntityResolutionTest, ConflictingEmailIsReportedAndFirstValueKept) {
    store.ingest({ janeSmith() }, "scrape_1");
    RawFacultyRecord other = janeSmith();
    other.email = "jane.smith@andrew.cmu.edu";
    IngestReport report = store.ingest({ other }, "scrape_2");
    EXPECT_EQ(report.merged, 1u);
    EXPECT_EQ(report.conflicts, 1u);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].kind, ErrorKind::EntityConflict);
    EXPECT_EQ(store.getFaculty(onlyFacultyId())->email.value_or(""), "jsmith@cmu.edu");
}

TEST_F(EntityResolutionTest, RecordsWithoutNameAreRejected) {
    RawFacultyRecord blank;
    blank.name = "   ";
    IngestReport report = store.ingest({ blank, janeSmith() }, "scrape_1");
    EXPECT_EQ(report.rejected, 1u);
    EXPECT_EQ(report.processed, 1u);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].kind, ErrorKind::ValidationRejected);
    EXPECT_EQ(store.facultyCount(), 1u);
}

TEST_F(EntityResolutionTest, MissingUniversityAndDepartmentGetDefaults) {
    RawFacultyRecord r;
    r.name = "Alan Turing";
    store.ingest({ r }, "scrape_1");
    FacultyEntity f = store.findFacultyByName("Alan Turing").at(0);
    EXPECT_EQ(f.primaryUniversityId, "univ_unknown");
    optional<UniversityEntity> u = store.getUniversity("univ_unknown");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->name, "Unknown University");
    EXPECT_EQ(u->domain, "unknown.edu");
    EXPECT_EQ(store.getDepartment(f.primaryDepartmentId)->name, "Unknown Department");
}

TEST_F(EntityResolutionTest, LabIsSharedAndPrincipalInvestigatorDetected) {
    RawFacultyRecord alan = janeSmith();
    alan.name = "Alan Turing";
    alan.email = "aturing@cmu.edu";
    IngestReport report = store.ingest({ withLab(janeSmith(), "Smith Vision Lab", "https://vision.cmu.edu"),
                                         withLab(alan, "Smith Vision Lab", "https://vision.cmu.edu") }, "scrape_1");
    EXPECT_EQ(report.labsCreated, 1u);
    EXPECT_EQ(store.labCount(), 1u);

    string labId = store.labIds().at(0);
    EXPECT_EQ(labId, "lab_univ_carnegie_mellon_smith_vision_lab");
    optional<LabAggregatedView> view = store.getLabAggregatedView(labId);
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->memberCount, 2u);
    EXPECT_EQ(view->piCount, 1u);
    EXPECT_DOUBLE_EQ(view->completenessScore, 0.8);
    ASSERT_EQ(view->departmentAssociations.size(), 1u);
    EXPECT_TRUE(view->departmentAssociations[0].second.has_value());

    for (const auto& p : view->facultyAssociations) {
        EXPECT_EQ(p.first.status, AssociationStatus::PendingVerification);
        if (p.second.normalizedName == "jane smith") EXPECT_EQ(p.first.role, PRINCIPAL_INVESTIGATOR_ROLE);
        else EXPECT_EQ(p.first.role, "member");
    }
    json j = toJson(*view);
    EXPECT_EQ(j["computed_metrics"]["pi_count"], 1);
    EXPECT_EQ(j["computed_metrics"]["is_multi_pi"], false);
}

TEST_F(EntityResolutionTest, BreakingAndRemovingAssociationKeepsEntities) {
    store.ingest({ withLab(janeSmith(), "Vision Lab", "https://vision.cmu.edu") }, "scrape_1");
    string facultyId = onlyFacultyId();
    string labId = store.labIds().at(0);
    string assocId = store.labAssociationsOf(facultyId).at(0).id;

    EXPECT_TRUE(store.breakFacultyLabAssociation(assocId));
    optional<FacultyLabAssociation> broken = store.getFacultyLabAssociation(assocId);
    ASSERT_TRUE(broken.has_value());
    EXPECT_EQ(broken->status, AssociationStatus::Inactive);
    EXPECT_FALSE(broken->isCurrent);
    EXPECT_TRUE(broken->endDate.has_value());
    EXPECT_FALSE(store.breakFacultyLabAssociation(assocId));

    EXPECT_TRUE(store.removeFacultyLabAssociation(assocId));
    EXPECT_FALSE(store.getFacultyLabAssociation(assocId).has_value());
    EXPECT_FALSE(store.removeFacultyLabAssociation(assocId));
    EXPECT_TRUE(store.getFaculty(facultyId).has_value());
    EXPECT_TRUE(store.getLab(labId).has_value());

    DataRelationshipMap m = store.generateRelationshipMap();
    EXPECT_EQ(m.orphanedLabs, vector<string>{ labId });
}

TEST_F(EntityResolutionTest, ContradictoryLabRolesAreDisputedPair) {
    store.ingest({ withLab(janeSmith(), "Vision Lab", "https://vision.cmu.edu") }, "scrape_1");
    IngestReport report = store.ingest({ withLab(janeSmith(), "Smith Vision Lab", "https://vision.cmu.edu") }, "scrape_2");
    EXPECT_EQ(report.conflicts, 1u);
    EXPECT_EQ(report.labsCreated, 0u);

    vector<FacultyLabAssociation> assocs = store.labAssociationsOf(onlyFacultyId());
    ASSERT_EQ(assocs.size(), 2u);
    for (const auto& a : assocs) {
        EXPECT_EQ(a.status, AssociationStatus::Disputed);
        ASSERT_EQ(a.conflictsWith.size(), 1u);
    }
    EXPECT_EQ(assocs[0].conflictsWith[0], assocs[1].id);
    EXPECT_EQ(assocs[1].conflictsWith[0], assocs[0].id);
    EXPECT_EQ(store.disputeQueue().size(), 2u);
}

TEST_F(EntityResolutionTest, AssociationReviewLifecycle) {
    store.ingest({ withLab(janeSmith(), "Vision Lab", "https://vision.cmu.edu") }, "scrape_1");
    string facultyId = onlyFacultyId();
    string labAssoc = store.labAssociationsOf(facultyId).at(0).id;
    string deptAssoc = store.departmentAssociationsOf(facultyId).at(0).id;

    EXPECT_TRUE(store.verifyAssociation(labAssoc, "curator"));
    EXPECT_EQ(store.getFacultyLabAssociation(labAssoc)->verifiedBy.value_or(""), "curator");
    EXPECT_FALSE(store.verifyAssociation(labAssoc, "curator"));
    EXPECT_FALSE(store.verifyAssociation(deptAssoc, "curator"));

    EXPECT_TRUE(store.disputeAssociation(labAssoc));
    EXPECT_TRUE(store.disputeAssociation(deptAssoc, labAssoc));
    EXPECT_EQ(store.disputeQueue(), (vector<string>{ labAssoc, deptAssoc }));
    EXPECT_FALSE(store.verifyAssociation(labAssoc, "curator"));
    EXPECT_FALSE(store.deactivateAssociation(labAssoc));
    EXPECT_FALSE(store.resolveDispute(labAssoc, AssociationStatus::PendingVerification, "curator"));

    EXPECT_TRUE(store.resolveDispute(labAssoc, AssociationStatus::Active, "curator"));
    EXPECT_EQ(store.getFacultyLabAssociation(labAssoc)->status, AssociationStatus::Active);
    EXPECT_EQ(store.disputeQueue(), vector<string>{ deptAssoc });
    EXPECT_FALSE(store.resolveDispute(labAssoc, AssociationStatus::Active, "curator"));

    EXPECT_TRUE(store.resolveDispute(deptAssoc, AssociationStatus::Inactive, "curator"));
    optional<FacultyDepartmentAssociation> dept = store.getFacultyDepartmentAssociation(deptAssoc);
    ASSERT_TRUE(dept.has_value());
    EXPECT_EQ(dept->status, AssociationStatus::Inactive);
    EXPECT_FALSE(dept->isCurrent);
    EXPECT_EQ(dept->conflictsWith, vector<string>{ labAssoc });
    EXPECT_TRUE(store.disputeQueue().empty());

    EXPECT_TRUE(store.deactivateAssociation(labAssoc));
    EXPECT_FALSE(store.deactivateAssociation(labAssoc));
    EXPECT_FALSE(store.verifyAssociation("fla_missing", "curator"));
}

TEST_F(EntityResolutionTest, DisputeQueueOutlivesTheStore) {
    store.ingest({ withLab(janeSmith(), "Vision Lab", "https://vision.cmu.edu") }, "scrape_1");
    string labAssoc = store.labAssociationsOf(onlyFacultyId()).at(0).id;
    ASSERT_TRUE(store.disputeAssociation(labAssoc));
    EXPECT_EQ(repo.disputeIds(), vector<string>{ labAssoc });

    EntityResolutionStore reopened(repo, clock.fn());
    EXPECT_EQ(reopened.disputeQueue(), vector<string>{ labAssoc });
    EXPECT_TRUE(reopened.resolveDispute(labAssoc, AssociationStatus::Active, "curator"));
    EXPECT_TRUE(store.disputeQueue().empty());

    RawFacultyRecord other = janeSmith();
    other.name = "Alan Turing";
    other.email = "aturing@cmu.edu";
    other.profileUrl = "https://www.cmu.edu/psychology/people/aturing";
    reopened.ingest({ other }, "scrape_2");
    EXPECT_EQ(reopened.facultyCount(), 2u);
    EXPECT_EQ(store.findFacultyByName("Alan Turing").size(), 1u);
}

TEST_F(EntityResolutionTest, ConcurrentIngestOfOnePersonCreatesOneEntity) {
    vector<thread> writers;
    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([this, i]() {
            store.ingest({ janeSmith() }, "scrape_" + to_string(i));
        });
    }
    for (auto& t : writers) t.join();

    EXPECT_EQ(store.facultyCount(), 1u);
    string facultyId = onlyFacultyId();
    EXPECT_EQ(store.departmentAssociationsOf(facultyId).size(), 1u);
}

TEST_F(EntityResolutionTest, EnrichmentLifecycle) {
    RawFacultyRecord r = janeSmith();
    r.bio = "Studies human memory.";
    r.researchInterests = { "memory", "attention" };
    store.ingest({ r }, "scrape_1");
    string facultyId = onlyFacultyId();
    optional<FacultyAggregatedView> view = store.getFacultyAggregatedView(facultyId);
    ASSERT_TRUE(view.has_value());
    ASSERT_EQ(view->enrichments["profile"].size(), 1u);
    string enrichmentId = view->enrichments["profile"][0]["id"].get<string>();

    EXPECT_EQ(store.getEnrichmentMeta(enrichmentId)->status, EnrichmentStatus::Fresh);
    EXPECT_FALSE(store.beginReextraction(enrichmentId));

    clock.advance(chrono::hours(48));
    EXPECT_EQ(store.markStaleEnrichments(chrono::hours(24)), 1u);
    EXPECT_EQ(store.getEnrichmentMeta(enrichmentId)->status, EnrichmentStatus::Stale);
    EXPECT_FALSE(store.markEnrichmentStale(enrichmentId));

    EXPECT_TRUE(store.beginReextraction(enrichmentId));
    EXPECT_EQ(store.getEnrichmentMeta(enrichmentId)->status, EnrichmentStatus::Processing);
    EXPECT_TRUE(store.recordReextraction(enrichmentId));
    optional<EnrichmentMeta> meta = store.getEnrichmentMeta(enrichmentId);
    EXPECT_EQ(meta->status, EnrichmentStatus::Fresh);
    EXPECT_EQ(meta->extractionCount, 2);
    EXPECT_TRUE(meta->extractedAt == clock.now());

    EXPECT_TRUE(store.markEnrichmentFailed(enrichmentId, "timeout"));
    meta = store.getEnrichmentMeta(enrichmentId);
    EXPECT_EQ(meta->status, EnrichmentStatus::Failed);
    EXPECT_EQ(meta->extractionErrors, vector<string>{ "timeout" });
    EXPECT_TRUE(store.beginReextraction(enrichmentId));

    EXPECT_TRUE(store.markEnrichmentValidated(enrichmentId));
    EXPECT_FALSE(store.markEnrichmentValidated(enrichmentId));
    EXPECT_FALSE(store.markEnrichmentStale(enrichmentId));
    EXPECT_FALSE(store.getEnrichmentMeta("profile_missing").has_value());
}

TEST_F(EntityResolutionTest, RepeatEnrichmentIncrementsCountInsteadOfAddingRow) {
    RawFacultyRecord r = janeSmith();
    r.bio = "Studies human memory.";
    IngestReport first = store.ingest({ r }, "scrape_1");
    IngestReport second = store.ingest({ r }, "scrape_2");
    EXPECT_EQ(first.enrichmentsCreated, 1u);
    EXPECT_EQ(second.enrichmentsCreated, 0u);
    optional<FacultyAggregatedView> view = store.getFacultyAggregatedView(onlyFacultyId());
    ASSERT_EQ(view->enrichments["profile"].size(), 1u);
    EXPECT_EQ(view->enrichments["profile"][0]["extraction_count"], 2);
}

TEST_F(EntityResolutionTest, RepeatIngestKeepsValidationAndFillsOnlyBlanks) {
    RawFacultyRecord r = janeSmith();
    r.bio = "Studies human memory.";
    store.ingest({ r }, "scrape_1");
    string enrichmentId = store.getFacultyAggregatedView(onlyFacultyId())->enrichments["profile"][0]["id"].get<string>();
    ASSERT_TRUE(store.markEnrichmentValidated(enrichmentId));

    RawFacultyRecord later = janeSmith();
    later.researchInterests = { "memory", "attention" };
    clock.advance(chrono::hours(1));
    store.ingest({ later }, "scrape_2");

    optional<ProfileEnrichment> row = repo.getProfileEnrichment(enrichmentId);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->meta.status, EnrichmentStatus::Validated);
    EXPECT_EQ(row->meta.extractionCount, 2);
    EXPECT_EQ(row->fullBiography.value_or(""), "Studies human memory.");
    EXPECT_EQ(row->researchKeywords, (vector<string>{ "memory", "attention" }));
}

TEST_F(EntityResolutionTest, RepeatIngestRecoversFailedEnrichmentAndKeepsErrors) {
    RawFacultyRecord r = janeSmith();
    r.bio = "Studies human memory.";
    store.ingest({ r }, "scrape_1");
    string enrichmentId = store.getFacultyAggregatedView(onlyFacultyId())->enrichments["profile"][0]["id"].get<string>();
    ASSERT_TRUE(store.markEnrichmentFailed(enrichmentId, "timeout"));

    clock.advance(chrono::hours(2));
    store.ingest({ r }, "scrape_2");
    optional<EnrichmentMeta> meta = store.getEnrichmentMeta(enrichmentId);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->status, EnrichmentStatus::Fresh);
    EXPECT_EQ(meta->extractionCount, 2);
    EXPECT_EQ(meta->extractionErrors, vector<string>{ "timeout" });
    EXPECT_TRUE(meta->extractedAt == clock.now());
}

TEST_F(EntityResolutionTest, CompletenessGrowsAndCapsAtOne) {
    RawFacultyRecord r = janeSmith();
    EXPECT_EQ(store.ingest({ r }, "scrape_1").enrichmentsCreated, 0u);
    double before = store.getFacultyAggregatedView(onlyFacultyId())->completenessScore;
    EXPECT_DOUBLE_EQ(before, 0.0);

    r.bio = "Studies human memory.";
    r.links = { json{ { "url", "https://scholar.example.org/jsmith" }, { "text", "Publications" } } };
    r.googleScholarUrl = "https://scholar.google.com/citations?user=abc";
    r.scholarData = json{ { "h_index", 42 }, { "citation_count", 9000 } };
    r.researchData = json{ { "publications", json::array({ "Memory and attention" }) } };
    store.ingest({ r }, "scrape_2");
    optional<FacultyAggregatedView> mid = store.getFacultyAggregatedView(onlyFacultyId());
    EXPECT_EQ(mid->totalEnrichments, 4u);
    EXPECT_DOUBLE_EQ(mid->completenessScore, 0.8);
    EXPECT_DOUBLE_EQ(mid->dataFreshnessScore, 1.0);

    r.profileUrl = "https://hcii.cmu.edu/people/jsmith";
    store.ingest({ r }, "scrape_3");
    optional<FacultyAggregatedView> full = store.getFacultyAggregatedView(onlyFacultyId());
    EXPECT_GT(full->totalEnrichments, 5u);
    EXPECT_DOUBLE_EQ(full->completenessScore, 1.0);
    EXPECT_GE(full->completenessScore, mid->completenessScore);

    clock.advance(chrono::hours(24 * 15));
    EXPECT_NEAR(store.getFacultyAggregatedView(onlyFacultyId())->dataFreshnessScore, 0.5, 1e-6);
}

TEST_F(EntityResolutionTest, MergeFoldsDuplicateIntoCanonical) {
    RawFacultyRecord stanford;
    stanford.name = "Jane Smith";
    stanford.university = "Stanford University";
    stanford.department = "Psychology";
    stanford.personalWebsite = "https://janesmith.example.org";
    store.ingest({ janeSmith(), stanford }, "scrape_1");
    ASSERT_EQ(store.facultyCount(), 2u);
    DataRelationshipMap before = store.generateRelationshipMap();
    ASSERT_EQ(before.potentialDuplicates.count("jane smith"), 1u);

    vector<FacultyEntity> both = store.findFacultyByName("Jane Smith");
    ASSERT_EQ(both.size(), 2u);
    string canonical = both[0].primaryUniversityId == "univ_carnegie_mellon" ? both[0].id : both[1].id;
    string duplicate = canonical == both[0].id ? both[1].id : both[0].id;

    EXPECT_FALSE(store.mergeFacultyEntities(canonical, canonical));
    EXPECT_TRUE(store.mergeFacultyEntities(canonical, duplicate));
    EXPECT_FALSE(store.mergeFacultyEntities(canonical, duplicate));

    optional<FacultyEntity> kept = store.getFaculty(canonical);
    optional<FacultyEntity> gone = store.getFaculty(duplicate);
    ASSERT_TRUE(kept.has_value());
    ASSERT_TRUE(gone.has_value());
    EXPECT_EQ(kept->personalWebsite.value_or(""), "https://janesmith.example.org");
    EXPECT_EQ(kept->email.value_or(""), "jsmith@cmu.edu");
    EXPECT_EQ(kept->mergedFrom, vector<string>{ duplicate });
    EXPECT_EQ(gone->status, EntityStatus::Merged);
    EXPECT_EQ(gone->duplicateOf.value_or(""), canonical);
    EXPECT_EQ(store.departmentAssociationsOf(canonical).size(), 2u);
    EXPECT_TRUE(store.departmentAssociationsOf(duplicate).empty());
    EXPECT_EQ(store.findFacultyByName("Jane Smith").size(), 1u);
    EXPECT_TRUE(store.generateRelationshipMap().potentialDuplicates.empty());
}

TEST_F(EntityResolutionTest, RelationshipMapCountsAndFlags) {
    RawFacultyRecord alan;
    alan.name = "Alan Turing";
    alan.university = "Carnegie Mellon University";
    alan.department = "Computer Science";
    alan.confidence = 0.6;
    store.ingest({ withLab(janeSmith(), "Smith Vision Lab", "https://vision.cmu.edu"), alan }, "scrape_1");

    DataRelationshipMap m = store.generateRelationshipMap();
    EXPECT_EQ(m.totalFaculty, 2u);
    EXPECT_EQ(m.totalLabs, 1u);
    EXPECT_EQ(m.totalUniversities, 1u);
    EXPECT_EQ(m.totalDepartments, 2u);
    EXPECT_EQ(m.facultyLabAssociations, 1u);
    EXPECT_EQ(m.facultyDepartmentAssociations, 2u);
    EXPECT_EQ(m.labDepartmentAssociations, 1u);
    EXPECT_TRUE(m.orphanedFaculty.empty());
    EXPECT_TRUE(m.orphanedLabs.empty());
    EXPECT_TRUE(m.orphanedEnrichments.empty());
    EXPECT_NEAR(m.averageConfidenceScore, (0.8 + 0.6 + LAB_ENTITY_CONFIDENCE) / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(m.dataCompleteness, 0.0);

    json j = toJson(m);
    EXPECT_EQ(j["total_faculty"], 2);
    EXPECT_TRUE(j["total_enrichments"].contains("google_scholar"));
}

TEST_F(EntityResolutionTest, FacultyViewJoinsEverything) {
    store.ingest({ withLab(janeSmith(), "Vision Lab", "https://vision.cmu.edu") }, "scrape_1");
    EXPECT_FALSE(store.getFacultyAggregatedView("fac_missing").has_value());
    optional<FacultyAggregatedView> v = store.getFacultyAggregatedView(onlyFacultyId());
    ASSERT_TRUE(v.has_value());
    ASSERT_TRUE(v->university.has_value());
    EXPECT_EQ(v->university->name, "Carnegie Mellon University");
    ASSERT_TRUE(v->primaryDepartment.has_value());
    EXPECT_EQ(v->primaryDepartment->name, "Psychology");
    ASSERT_EQ(v->labAssociations.size(), 1u);
    EXPECT_EQ(v->labAssociations[0].second->name, "Vision Lab");
    EXPECT_EQ(v->enrichments.size(), ENRICHMENT_TYPES.size());
    EXPECT_EQ(v->dataSources, vector<string>{ "https://www.cmu.edu/psychology/people/jsmith" });

    json j = toJson(*v);
    EXPECT_EQ(j["computed_metrics"]["lab_count"], 1);
    EXPECT_EQ(j["computed_metrics"]["department_count"], 1);
    EXPECT_EQ(j["faculty"]["name"], "Dr. Jane Smith");
}

TEST_F(EntityResolutionTest, ExportWritesThreeJsonFiles) {
    store.ingest({ withLab(janeSmith(), "Vision Lab", "https://vision.cmu.edu") }, "scrape_1");
    filesystem::path dir = filesystem::temp_directory_path() / ("facultygraph_export_" + to_string(::getpid()));
    map<string, string> paths = store.exportAggregatedViews(dir.string());

    ASSERT_EQ(paths.size(), 3u);
    EXPECT_EQ(paths.count("faculty_views"), 1u);
    EXPECT_EQ(paths.count("lab_views"), 1u);
    EXPECT_EQ(paths.count("relationship_map"), 1u);

    ifstream facultyFile(paths["faculty_views"]);
    json facultyViews = json::parse(facultyFile);
    ASSERT_TRUE(facultyViews.is_array());
    EXPECT_EQ(facultyViews.size(), 1u);
    ifstream mapFile(paths["relationship_map"]);
    json relationshipMap = json::parse(mapFile);
    EXPECT_EQ(relationshipMap["total_labs"], 1);

    filesystem::remove_all(dir);
}

TEST(RawFacultyRecord, AliasesAreReadInPriorityOrder) {
    json j = json::parse(R"({
        "full_name": "  Jane Smith ",
        "position": "Professor",
        "email_address": "",
        "contact_email": "jsmith@cmu.edu",
        "institution": "Carnegie Mellon University",
        "lab_urls": ["https://vision.cmu.edu", "https://old.cmu.edu"],
        "research_areas": "memory, attention ,",
        "publications": ["Memory and attention"],
        "confidence_score": 0.9
    })");
    optional<RawFacultyRecord> r = rawFacultyRecordFromJson(j);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->name, "Jane Smith");
    EXPECT_EQ(r->title.value_or(""), "Professor");
    EXPECT_EQ(r->email.value_or(""), "jsmith@cmu.edu");
    EXPECT_EQ(r->university.value_or(""), "Carnegie Mellon University");
    EXPECT_EQ(r->labWebsite.value_or(""), "https://vision.cmu.edu");
    EXPECT_EQ(r->researchInterests, (vector<string>{ "memory", "attention" }));
    ASSERT_TRUE(r->researchData.has_value());
    EXPECT_EQ((*r->researchData)["publications"].size(), 1u);
    EXPECT_DOUBLE_EQ(r->confidence.value_or(0.0), 0.9);
    EXPECT_FALSE(r->department.has_value());

    EXPECT_FALSE(rawFacultyRecordFromJson(json::parse(R"({"title": "Professor"})")).has_value());
    EXPECT_FALSE(rawFacultyRecordFromJson(json::array()).has_value());
}
