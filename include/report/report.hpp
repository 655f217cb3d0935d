#pragma once

#include "model/reports.hpp"

#include <ostream>
#include <string>
#include <vector>

class Clinic;

/**
 * @brief One row per doctor, ordered by doctor id.
 */
std::vector<DoctorReport> reportPerDoctor(const Clinic& clinic);

/**
 * @brief Served token count vs tokens still waiting (routine queue + triage).
 */
ServedPendingReport reportServedVsPending(const Clinic& clinic);

/**
 * @brief Patients with the most served visits.
 * @param k maximum number of rows (k <= 0 yields an empty list).
 * @return (patientId, count) by descending count; equal counts keep the order
 *         in which the patient first appears in the served history.
 */
std::vector<PatientFrequency> topKFrequentPatients(const Clinic& clinic, int k);

/** @brief Render every report as plain text. */
bool writeSummaryText(const Clinic& clinic, std::ostream& out, int topK = 3);

/** @brief writeSummaryText into a freshly truncated file. */
bool writeSummary(const Clinic& clinic, const std::string& path, int topK = 3);
