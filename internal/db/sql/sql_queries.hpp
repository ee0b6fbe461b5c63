#pragma once

namespace sitely::db::sql {

/*
  Canonical SQL used by the sqlite repository.

  INSERT_* statements carry no terminator: the repository appends
  ON_CONFLICT_ID_DO_NOTHING for insert-if-absent writes. That clause only
  targets the primary key, so CHECK / NOT NULL / foreign key failures still
  surface as errors instead of being skipped.

  Ledger reads take a cutoff date; `date >= cutoff` keeps rows inside the
  retention horizon and an empty cutoff keeps everything.
*/

static constexpr const char* ON_CONFLICT_ID_DO_NOTHING = " ON CONFLICT(id) DO NOTHING";

// sites

static constexpr const char* INSERT_SITE =
    "INSERT INTO sites(id,name,type,location,startDate,endDate,isRunning,ownerName,contact,siteCode,userId,createdAt)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?)";

#define SITELY_SITE_COLUMNS "id,name,type,location,startDate,endDate,isRunning,ownerName,contact,siteCode,userId,createdAt"

static constexpr const char* SELECT_SITE =
    "SELECT " SITELY_SITE_COLUMNS " FROM sites WHERE id=?;";

static constexpr const char* SELECT_SITE_BY_CODE =
    "SELECT " SITELY_SITE_COLUMNS " FROM sites WHERE siteCode=upper(?) ORDER BY createdAt LIMIT 1;";

static constexpr const char* SELECT_ALL_SITES =
    "SELECT " SITELY_SITE_COLUMNS " FROM sites ORDER BY createdAt DESC, id DESC;";

static constexpr const char* SELECT_USER_SITES =
    "SELECT " SITELY_SITE_COLUMNS " FROM sites WHERE userId=? OR userId IS NULL ORDER BY createdAt DESC, id DESC;";

#undef SITELY_SITE_COLUMNS

static constexpr const char* DELETE_SITE =
    "DELETE FROM sites WHERE id=?;";

// workers

static constexpr const char* INSERT_WORKER =
    "INSERT INTO workers(id,siteId,name,age,contact,village,category,photoUri,joiningDate,isActive)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)";

static constexpr const char* SELECT_WORKER =
    "SELECT id,siteId,name,age,contact,village,category,photoUri,joiningDate,isActive"
    " FROM workers WHERE id=?;";

static constexpr const char* SELECT_SITE_WORKERS =
    "SELECT id,siteId,name,age,contact,village,category,photoUri,joiningDate,isActive"
    " FROM workers WHERE siteId=? ORDER BY joiningDate DESC, id DESC;";

static constexpr const char* DELETE_WORKER =
    "DELETE FROM workers WHERE id=?;";

// ledger rows

static constexpr const char* INSERT_WAGE =
    "INSERT INTO hajari(id,siteId,workerId,workerName,workerCategory,amount,overtime,date,time)"
    " VALUES(?,?,?,?,?,?,?,?,?)";

static constexpr const char* INSERT_EXPENSE =
    "INSERT INTO expenses(id,siteId,workerId,workerName,workerCategory,amount,description,date,time)"
    " VALUES(?,?,?,?,?,?,?,?,?)";

static constexpr const char* INSERT_PAYMENT =
    "INSERT INTO payments(id,siteId,workerId,workerName,workerCategory,amount,method,date,time)"
    " VALUES(?,?,?,?,?,?,?,?,?)";

static constexpr const char* SELECT_WAGES =
    "SELECT id,siteId,workerId,workerName,workerCategory,amount,overtime,date,time"
    " FROM hajari WHERE siteId=? AND date>=?"
    " ORDER BY date DESC, time DESC, id DESC;";

static constexpr const char* SELECT_EXPENSES =
    "SELECT id,siteId,workerId,workerName,workerCategory,amount,description,date,time"
    " FROM expenses WHERE siteId=? AND date>=?"
    " ORDER BY date DESC, time DESC, id DESC;";

static constexpr const char* SELECT_PAYMENTS =
    "SELECT id,siteId,workerId,workerName,workerCategory,amount,method,date,time"
    " FROM payments WHERE siteId=?1 AND date>=?2 AND (?3 IS NULL OR workerId=?3)"
    " ORDER BY date DESC, time DESC, id DESC;";

// One statement, three engine-side sums.
static constexpr const char* SELECT_WORKER_TOTALS =
    "SELECT"
    " (SELECT COALESCE(SUM(amount + overtime),0) FROM hajari WHERE siteId=?1 AND workerId=?2 AND date>=?3),"
    " (SELECT COALESCE(SUM(amount),0) FROM expenses WHERE siteId=?1 AND workerId=?2 AND date>=?3),"
    " (SELECT COALESCE(SUM(amount),0) FROM payments WHERE siteId=?1 AND workerId=?2 AND date>=?3);";

static constexpr const char* SELECT_SITE_WORKER_SUMMARIES =
    "SELECT w.id,w.name,w.category,"
    " COALESCE(h.total,0),COALESCE(e.total,0),COALESCE(p.total,0),p.last_date"
    " FROM workers w"
    " LEFT JOIN (SELECT workerId,SUM(amount + overtime) AS total FROM hajari"
    "            WHERE siteId=?1 AND date>=?2 GROUP BY workerId) h ON h.workerId=w.id"
    " LEFT JOIN (SELECT workerId,SUM(amount) AS total FROM expenses"
    "            WHERE siteId=?1 AND date>=?2 GROUP BY workerId) e ON e.workerId=w.id"
    " LEFT JOIN (SELECT workerId,SUM(amount) AS total,MAX(date) AS last_date FROM payments"
    "            WHERE siteId=?1 AND date>=?2 GROUP BY workerId) p ON p.workerId=w.id"
    " WHERE w.siteId=?1"
    " ORDER BY w.joiningDate DESC, w.id DESC;";

// materials

static constexpr const char* INSERT_MATERIAL =
    "INSERT INTO materials(id,siteId,name,vendorName,vendorPhone,quantity,unit,ratePerUnit,totalAmount,amountPaid,billPhotoUri,purchasedAt)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?)";

static constexpr const char* SELECT_MATERIAL =
    "SELECT id,siteId,name,vendorName,vendorPhone,quantity,unit,ratePerUnit,totalAmount,amountPaid,billPhotoUri,purchasedAt"
    " FROM materials WHERE id=?;";

static constexpr const char* SELECT_SITE_MATERIALS =
    "SELECT id,siteId,name,vendorName,vendorPhone,quantity,unit,ratePerUnit,totalAmount,amountPaid,billPhotoUri,purchasedAt"
    " FROM materials WHERE siteId=? ORDER BY purchasedAt DESC, id DESC;";

static constexpr const char* DELETE_MATERIAL =
    "DELETE FROM materials WHERE id=?;";

static constexpr const char* INSERT_MATERIAL_USAGE =
    "INSERT INTO material_usages(id,materialId,siteId,quantityUsed,description,date)"
    " VALUES(?,?,?,?,?,?)";

static constexpr const char* SELECT_MATERIAL_USAGES =
    "SELECT id,materialId,siteId,quantityUsed,description,date"
    " FROM material_usages WHERE materialId=? ORDER BY date DESC, id DESC;";

static constexpr const char* SELECT_MATERIAL_STOCK =
    "SELECT m.id,m.quantity,COALESCE(SUM(u.quantityUsed),0)"
    " FROM materials m LEFT JOIN material_usages u ON u.materialId=m.id"
    " WHERE m.id=? GROUP BY m.id;";

// photos

static constexpr const char* INSERT_PHOTO_GROUP =
    "INSERT INTO photo_groups(id,siteId,name,createdAt) VALUES(?,?,?,?)";

static constexpr const char* SELECT_PHOTO_GROUPS =
    "SELECT id,siteId,name,createdAt FROM photo_groups WHERE siteId=? ORDER BY createdAt DESC, id DESC;";

static constexpr const char* DELETE_PHOTO_GROUP =
    "DELETE FROM photo_groups WHERE id=?;";

static constexpr const char* INSERT_PHOTO =
    "INSERT INTO photos(id,siteId,groupId,uri,description,date,time) VALUES(?,?,?,?,?,?,?)";

static constexpr const char* SELECT_SITE_PHOTOS =
    "SELECT id,siteId,groupId,uri,description,date,time"
    " FROM photos WHERE siteId=? ORDER BY date DESC, time DESC, id DESC;";

static constexpr const char* SELECT_GROUP_PHOTOS =
    "SELECT id,siteId,groupId,uri,description,date,time"
    " FROM photos WHERE groupId=? ORDER BY date DESC, time DESC, id DESC;";

static constexpr const char* DELETE_PHOTO =
    "DELETE FROM photos WHERE id=?;";

// todos

static constexpr const char* INSERT_TODO =
    "INSERT INTO todos(id,title,description,type,priority,deadline,completed,completedAt,siteId,createdAt)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)";

static constexpr const char* SELECT_TODO =
    "SELECT id,title,description,type,priority,deadline,completed,completedAt,siteId,createdAt"
    " FROM todos WHERE id=?;";

static constexpr const char* SELECT_TODOS =
    "SELECT id,title,description,type,priority,deadline,completed,completedAt,siteId,createdAt"
    " FROM todos WHERE (?1 IS NULL OR type=?1) ORDER BY createdAt DESC, id DESC;";

static constexpr const char* UPDATE_TODO_COMPLETED =
    "UPDATE todos SET completed=?,completedAt=? WHERE id=?;";

static constexpr const char* DELETE_TODO =
    "DELETE FROM todos WHERE id=?;";

// settings

static constexpr const char* SELECT_SETTING =
    "SELECT value FROM settings WHERE key=?;";

static constexpr const char* UPSERT_SETTING =
    "INSERT INTO settings(key,value) VALUES(?,?)"
    " ON CONFLICT(key) DO UPDATE SET value=excluded.value;";

static constexpr const char* INSERT_SETTING_IF_ABSENT =
    "INSERT INTO settings(key,value) VALUES(?,?)"
    " ON CONFLICT(key) DO NOTHING;";

static constexpr const char* DELETE_SETTING =
    "DELETE FROM settings WHERE key=?;";

}
